#pragma once

#include <string>

namespace flowcheck::db::model {

struct SprintRecord {
  std::string id;
  std::string name;
  std::string status; // planned | active | closed
  std::string project_id;

  std::string created_at;
  std::string updated_at;
  std::string completed_at;
};

} // namespace flowcheck::db::model
