#pragma once

#include <string>

namespace flowcheck::db::model {

struct ProjectRecord {
  std::string id;
  std::string name;
  std::string status; // discovery | active | paused | closed

  std::string created_at;
  std::string updated_at;
  std::string completed_at;
};

} // namespace flowcheck::db::model
