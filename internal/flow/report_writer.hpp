#pragma once

#include <filesystem>
#include <string>

#include <google/protobuf/message.h>

#include "flow_graph.hpp"
#include "flowcheck/v1/report.pb.h"

namespace flowcheck::flow {

/*
  Serialization and presentation of a finished run.

  JSON uses the proto field names, prints default values and is indented,
  so downstream tooling sees every field on every run.
*/
class ReportWriter {
 public:
  // Throws std::runtime_error if serialization fails.
  static std::string ToJson(const google::protobuf::Message& message);

  // Writes <dir>/flow_<flow_id>.json, creating dir. Returns the path.
  static std::filesystem::path Persist(const v1::FlowReport& report, const std::filesystem::path& dir);

  // Writes `content` to `path` in one go; throws std::runtime_error.
  static void WriteFile(const std::filesystem::path& path, const std::string& content);

  static std::string RenderSummary(const v1::FlowReport& report, std::size_t max_recommendations = 5);

  static std::string RenderGraph(const FlowGraph& graph);
};

} // namespace flowcheck::flow
