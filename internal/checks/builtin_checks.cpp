#include "builtin_checks.hpp"

#include "audit_trail_check.hpp"
#include "crud_check.hpp"
#include "data_integrity_check.hpp"
#include "performance_check.hpp"
#include "relationship_check.hpp"
#include "state_transition_check.hpp"

namespace flowcheck::checks {

void RegisterBuiltinChecks(flow::CheckRegistry& registry) {
  registry.Register("integrity", [] { return std::make_shared<DataIntegrityCheck>(); });
  registry.Register("crud", [] { return std::make_shared<CrudCheck>(); });
  registry.Register("state", [] { return std::make_shared<StateTransitionCheck>(); });
  registry.Register("relationship", [] { return std::make_shared<RelationshipCheck>(); });
  registry.Register("audit", [] { return std::make_shared<AuditTrailCheck>(); });
  registry.Register("performance", [] { return std::make_shared<PerformanceCheck>(); });
}

flow::CheckRegistry BuiltinRegistry() {
  flow::CheckRegistry registry;
  RegisterBuiltinChecks(registry);
  return registry;
}

} // namespace flowcheck::checks
