#pragma once

#include <string>

namespace flowcheck::db::model {

/*
  Work item row.

  Nullable text columns are represented by the empty string.
  depends_on / blocks / assignees hold JSON text as written by the tracker.
*/

struct TaskRecord {
  std::string id;
  std::string title;
  std::string status;
  std::string priority;

  std::string project_id;
  std::string sprint_id;
  std::string owner;

  // ISO-8601 text
  std::string created_at;
  std::string updated_at;
  std::string completed_at;
  std::string deleted_at;

  // embedded structures (JSON arrays)
  std::string depends_on;
  std::string blocks;
  std::string assignees;

  std::string audit_tag;
  std::string correlation_hint;

  bool IsDeleted() const {
    return !deleted_at.empty();
  }
};

} // namespace flowcheck::db::model
