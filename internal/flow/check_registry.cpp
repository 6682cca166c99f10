#include "check_registry.hpp"

#include "internal/util/errors.hpp"

namespace flowcheck::flow {

void CheckRegistry::Register(const std::string& id, CheckFactory factory) {
  if (id.empty()) {
    throw util::InvalidConfig("check id must not be empty");
  }
  if (!factory) {
    throw util::InvalidConfig("check " + id + " registered without a factory");
  }
  if (!factories_.emplace(id, std::move(factory)).second) {
    throw util::InvalidConfig("check " + id + " registered twice");
  }
}

std::shared_ptr<Check> CheckRegistry::Create(const std::string& id) const {
  auto it = factories_.find(id);
  if (it == factories_.end()) {
    throw util::NotFound("no check registered as " + id);
  }
  return it->second();
}

bool CheckRegistry::Contains(const std::string& id) const {
  return factories_.count(id) > 0;
}

std::vector<std::string> CheckRegistry::Ids() const {
  std::vector<std::string> ids;
  ids.reserve(factories_.size());
  for (const auto& [id, _] : factories_) ids.push_back(id);
  return ids;
}

} // namespace flowcheck::flow
