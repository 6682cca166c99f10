#pragma once

#include <memory>
#include <string_view>

#include "check_outcome.hpp"
#include "config/config.pb.h"
#include "internal/db/api/store.hpp"
#include "internal/probe/task_api.hpp"

namespace flowcheck::flow {

/*
  What a check may look at.

  The context is copied into every invocation; a check that outlives its
  timeout keeps its own references alive.
*/
struct CheckContext {
  std::shared_ptr<db::Store>                store;
  std::shared_ptr<probe::TaskApi>           task_api;
  std::shared_ptr<const config::FlowConfig> config;
  db::StoreFilter                           filter;
};

/*
  A validation unit.

  Validate() reads the store (and, for behavioural checks, drives the task
  service sandbox) and reports what it saw. It must not write to the
  store and must not retry. Anything it throws is recorded as a node fault.
*/
class Check {
 public:
  virtual ~Check() = default;

  virtual std::string_view Name() const = 0;

  virtual CheckOutcome Validate(const CheckContext& ctx) = 0;
};

} // namespace flowcheck::flow
