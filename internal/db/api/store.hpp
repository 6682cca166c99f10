#pragma once

#include <string>
#include <vector>

#include "internal/db/model/project_record.hpp"
#include "internal/db/model/sprint_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace flowcheck::db {

/*
  Restricts a listing to one sprint and/or one project.
  Empty fields do not filter.
*/
struct StoreFilter {
  std::string sprint_id;
  std::string project_id;

  bool Empty() const {
    return sprint_id.empty() && project_id.empty();
  }
};

/*
  Read-only view of the task tracking store.

  GUARANTEES:

  - No method mutates the store.
  - Methods are safe to call concurrently from several workers.
  - Backend failures surface as util::StoreUnavailable; there are no
    internal retries.

  Listings return soft-deleted rows as well; callers decide how to
  treat them. Rows come back ordered by id.
*/
class Store {
 public:
  virtual ~Store() = default;

  // Tasks whose sprint_id / project_id match the filter.
  virtual std::vector<model::TaskRecord> ListTasks(const StoreFilter& filter) = 0;

  // Sprints with id == filter.sprint_id and/or project_id == filter.project_id.
  virtual std::vector<model::SprintRecord> ListSprints(const StoreFilter& filter) = 0;

  // Projects with id == filter.project_id.
  virtual std::vector<model::ProjectRecord> ListProjects(const StoreFilter& filter) = 0;

  virtual bool IsHealthy() = 0;

  // Backend name and location, for logs and reports.
  virtual std::string Describe() const = 0;
};

} // namespace flowcheck::db
