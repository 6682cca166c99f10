#include "flow_graph.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace flowcheck::flow {

FlowGraph::FlowGraph(std::vector<NodeSpec> specs) {
  for (auto& spec : specs) {
    if (nodes_.count(spec.id)) {
      throw util::DuplicateNode("duplicate node id: " + spec.id);
    }

    Node node;
    node.id           = spec.id;
    node.name         = spec.name.empty() ? spec.id : std::move(spec.name);
    node.check        = std::move(spec.check);
    node.dependencies = std::move(spec.dependencies);
    node.skip         = spec.skip;
    node.skip_reason  = std::move(spec.skip_reason);
    nodes_.emplace(spec.id, std::move(node));
  }

  for (const auto& [id, node] : nodes_) {
    for (const auto& dep : node.dependencies) {
      if (dep == id) {
        throw util::CycleDetected("node depends on itself: " + id);
      }
      if (!nodes_.count(dep)) {
        throw util::UnknownDependency("node " + id + " depends on unknown node " + dep);
      }
    }
  }

  Schedule();
}

void FlowGraph::Schedule() {
  std::map<std::string, std::size_t>              in_degree;
  std::map<std::string, std::vector<std::string>> dependents;

  for (const auto& [id, node] : nodes_) {
    in_degree[id];
    for (const auto& dep : node.dependencies) {
      ++in_degree[id];
      dependents[dep].push_back(id);
    }
  }

  std::vector<std::string> ready;
  for (const auto& [id, degree] : in_degree) {
    if (degree == 0) ready.push_back(id);
  }

  while (!ready.empty()) {
    std::sort(ready.begin(), ready.end());

    std::vector<std::string> next;
    for (const auto& id : ready) {
      nodes_.at(id).layer = layers_.size();
      order_.push_back(id);
      for (const auto& child : dependents[id]) {
        if (--in_degree[child] == 0) next.push_back(child);
      }
    }

    layers_.push_back(std::move(ready));
    ready = std::move(next);
  }

  if (order_.size() != nodes_.size()) {
    std::string stuck;
    for (const auto& [id, degree] : in_degree) {
      if (degree == 0) continue;
      if (!stuck.empty()) stuck += ", ";
      stuck += id;
    }
    throw util::CycleDetected("cycle detected among nodes: " + stuck);
  }
}

bool FlowGraph::Contains(const std::string& id) const {
  return nodes_.count(id) > 0;
}

Node& FlowGraph::At(const std::string& id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) throw util::NotFound("no such node: " + id);
  return it->second;
}

const Node& FlowGraph::At(const std::string& id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) throw util::NotFound("no such node: " + id);
  return it->second;
}

} // namespace flowcheck::flow
