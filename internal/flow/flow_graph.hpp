#pragma once

#include <map>
#include <string>
#include <vector>

#include "node.hpp"

namespace flowcheck::flow {

/*
  FlowGraph

  Owns the nodes of one run and their dependency DAG.

  Construction validates the graph and fixes the schedule:

    - duplicate ids                    -> util::DuplicateNode
    - dependency on an unknown id      -> util::UnknownDependency
    - cycle (self-dependency included) -> util::CycleDetected

  Layers come from a Kahn reduction that removes every zero in-degree node
  at once. Layer k holds the nodes whose dependencies all sit in layers < k;
  ids inside a layer are sorted, and the execution order is the layers
  concatenated. Both are identical across runs on the same input.
*/
class FlowGraph {
 public:
  explicit FlowGraph(std::vector<NodeSpec> specs);

  FlowGraph(const FlowGraph&)            = delete;
  FlowGraph& operator=(const FlowGraph&) = delete;
  FlowGraph(FlowGraph&&)                 = default;
  FlowGraph& operator=(FlowGraph&&)      = default;

  const std::vector<std::string>& ExecutionOrder() const {
    return order_;
  }

  const std::vector<std::vector<std::string>>& Layers() const {
    return layers_;
  }

  std::size_t Size() const {
    return nodes_.size();
  }

  bool Contains(const std::string& id) const;

  // Throws util::NotFound.
  Node&       At(const std::string& id);
  const Node& At(const std::string& id) const;

 private:
  void Schedule();

  std::map<std::string, Node>           nodes_;
  std::vector<std::string>              order_;
  std::vector<std::vector<std::string>> layers_;
};

} // namespace flowcheck::flow
