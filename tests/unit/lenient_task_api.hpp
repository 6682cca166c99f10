#pragma once

#include <map>
#include <string>

#include "internal/probe/task_api.hpp"

namespace flowcheck::testing {

// Accepts every request: no validation, no workflow, hard deletes.
class LenientTaskApi final : public probe::TaskApi {
 public:
  probe::ApiResponse Create(const probe::TaskDraft& draft) override {
    db::model::TaskRecord t;
    t.id       = draft.id.empty() ? "L-" + std::to_string(++next_) : draft.id;
    t.title    = draft.title;
    t.status   = draft.status;
    t.priority = draft.priority;
    tasks_[t.id] = t;
    return {probe::kCreated, t, {}, {}};
  }

  probe::ApiResponse Get(const std::string& id) override {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return {probe::kOk, std::nullopt, {}, {}};
    return {probe::kOk, it->second, {}, {}};
  }

  probe::ApiResponse List(const probe::TaskQuery& query) override {
    probe::ApiResponse r{probe::kOk, std::nullopt, {}, {}};
    for (const auto& [id, t] : tasks_) {
      if (query.status.empty() || t.status == query.status) r.tasks.push_back(t);
    }
    return r;
  }

  probe::ApiResponse Update(const std::string& id, const probe::TaskPatch& patch) override {
    auto& t = tasks_[id];
    t.id    = id;
    if (patch.status) t.status = *patch.status;
    if (patch.priority) t.priority = *patch.priority;
    if (patch.title) t.title = *patch.title;
    return {probe::kOk, t, {}, {}};
  }

  probe::ApiResponse Delete(const std::string& id) override {
    tasks_.erase(id);
    return {probe::kOk, std::nullopt, {}, {}};
  }

 private:
  int                                          next_ = 0;
  std::map<std::string, db::model::TaskRecord> tasks_;
};

} // namespace flowcheck::testing
