#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "check.hpp"

namespace flowcheck::flow {

using CheckFactory = std::function<std::shared_ptr<Check>()>;

/*
  Maps a stable check id to the factory that builds it. Graphs are
  declared by id; the registry turns ids into Check instances.
*/
class CheckRegistry {
 public:
  // Throws util::InvalidConfig if the id is empty or already registered.
  void Register(const std::string& id, CheckFactory factory);

  // Throws util::NotFound for an unknown id.
  std::shared_ptr<Check> Create(const std::string& id) const;

  bool Contains(const std::string& id) const;

  // Sorted.
  std::vector<std::string> Ids() const;

 private:
  std::map<std::string, CheckFactory> factories_;
};

} // namespace flowcheck::flow
