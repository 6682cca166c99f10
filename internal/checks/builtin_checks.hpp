#pragma once

#include "internal/flow/check_registry.hpp"

namespace flowcheck::checks {

// Registers integrity, crud, state, relationship, audit and performance.
void RegisterBuiltinChecks(flow::CheckRegistry& registry);

flow::CheckRegistry BuiltinRegistry();

} // namespace flowcheck::checks
