#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/task_record.hpp"

namespace flowcheck::probe {

/*
  Task service surface exercised by the crud, state and performance checks.

  Status codes follow the tracker's HTTP API:
    201 created, 200 ok, 404 not found, 409 conflict, 422 invalid input
*/

constexpr int kCreated       = 201;
constexpr int kOk            = 200;
constexpr int kNotFound      = 404;
constexpr int kConflict      = 409;
constexpr int kUnprocessable = 422;

struct TaskDraft {
  // Generated when empty.
  std::string id;
  std::string title;
  std::string status   = "new";
  std::string priority = "medium";

  std::string project_id;
  std::string sprint_id;
  std::string owner;

  std::string depends_on;
  std::string blocks;
  std::string assignees;

  std::string audit_tag;
  std::string correlation_hint;
};

// Unset fields are left unchanged.
struct TaskPatch {
  std::optional<std::string> title;
  std::optional<std::string> status;
  std::optional<std::string> priority;
  std::optional<std::string> project_id;
  std::optional<std::string> sprint_id;
  std::optional<std::string> owner;
};

struct TaskQuery {
  std::string status;
  std::size_t limit = 100;
};

struct ApiResponse {
  int status_code = 0;

  std::optional<db::model::TaskRecord> task;
  std::vector<db::model::TaskRecord>   tasks;

  std::string error;

  bool Ok() const {
    return status_code >= 200 && status_code < 300;
  }
};

class TaskApi {
 public:
  virtual ~TaskApi() = default;

  virtual ApiResponse Create(const TaskDraft& draft) = 0;
  virtual ApiResponse Get(const std::string& id) = 0;
  virtual ApiResponse List(const TaskQuery& query) = 0;
  virtual ApiResponse Update(const std::string& id, const TaskPatch& patch) = 0;

  // Soft delete: the row stays readable with deleted_at set.
  virtual ApiResponse Delete(const std::string& id) = 0;
};

} // namespace flowcheck::probe
