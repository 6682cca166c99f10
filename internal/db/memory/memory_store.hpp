#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/store.hpp"

namespace flowcheck::db::memory {

/*
  In-process Store used by tests and for seeding.

  Rows are kept in insertion order and no key checks are made, so
  duplicate ids can be represented.
*/
class MemoryStore final : public db::Store {
public:
  MemoryStore();

  void AddTask(model::TaskRecord task);
  void AddSprint(model::SprintRecord sprint);
  void AddProject(model::ProjectRecord project);

  // Every later read throws util::StoreUnavailable.
  void SetUnavailable(bool unavailable);

  std::vector<model::TaskRecord> ListTasks(const StoreFilter& filter) override;
  std::vector<model::SprintRecord> ListSprints(const StoreFilter& filter) override;
  std::vector<model::ProjectRecord> ListProjects(const StoreFilter& filter) override;

  bool IsHealthy() override;
  std::string Describe() const override;

private:
  void ThrowIfUnavailable() const;

  mutable std::mutex mutex_;
  std::vector<model::TaskRecord> tasks_;
  std::vector<model::SprintRecord> sprints_;
  std::vector<model::ProjectRecord> projects_;
  bool unavailable_ = false;
};

}
