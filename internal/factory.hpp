#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/store.hpp"
#include "internal/probe/task_api.hpp"

namespace flowcheck::factory {

/*
  Collaborators a validation run needs. The store is the tracker data under
  inspection; the task service sandbox is private to the run.
*/
struct RunDependencies {
  std::shared_ptr<db::Store>      store;
  std::shared_ptr<probe::TaskApi> task_api;
};

/*
  BuildStore

  Opens the backend named by config.database.

  NOTE:
  This is the only place allowed to know concrete store types.
  Throws util::InvalidConfig when no usable backend is configured and
  util::StoreUnavailable when it cannot be opened.
*/
std::shared_ptr<db::Store> BuildStore(const flowcheck::config::FlowConfig& config);

// Task service over a fresh sandbox at config.probe.sandbox_path.
std::shared_ptr<probe::TaskApi> BuildTaskApi(const flowcheck::config::FlowConfig& config);

RunDependencies Build(const flowcheck::config::FlowConfig& config);

} // namespace flowcheck::factory
