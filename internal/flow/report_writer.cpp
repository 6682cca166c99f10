#include "report_writer.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace flowcheck::flow {

std::string ReportWriter::ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void ReportWriter::WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + path.string() + " for writing");
  }
  out << content;
  out.flush();
  if (!out) {
    throw std::runtime_error("failed writing " + path.string());
  }
}

std::filesystem::path ReportWriter::Persist(const v1::FlowReport& report, const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create " + dir.string() + ": " + ec.message());
  }

  auto path = dir / ("flow_" + report.flow_id() + ".json");
  WriteFile(path, ToJson(report));
  return path;
}

std::string ReportWriter::RenderSummary(const v1::FlowReport& report, std::size_t max_recommendations) {
  const auto& flow = report.flow_summary();
  const auto& v    = report.validation_summary();

  char rate[32];
  std::snprintf(rate, sizeof(rate), "%.2f", v.success_rate());
  char duration[32];
  std::snprintf(duration, sizeof(duration), "%.2f", report.duration_seconds());

  std::ostringstream out;
  out << "Flow " << report.flow_id() << "\n";
  out << "Overall Status: " << report.overall_status() << "\n";
  out << "Duration: " << duration << "s\n\n";

  out << "Flow Summary:\n";
  out << "  Nodes: " << flow.completed() << "/" << flow.total_nodes() << " completed";
  if (flow.failed() > 0) out << ", " << flow.failed() << " failed";
  if (flow.blocked() > 0) out << ", " << flow.blocked() << " blocked";
  if (flow.skipped() > 0) out << ", " << flow.skipped() << " skipped";
  if (flow.aborted()) out << " (aborted)";
  out << "\n";
  out << "  Checks: " << v.passed() << "/" << v.total_checks() << " passed\n";
  out << "  Success Rate: " << rate << "%\n";

  out << "\nNodes:\n";
  for (const auto& n : report.nodes()) {
    out << "  " << n.id() << ": " << n.status();
    if (n.has_outcome() && n.status() == "COMPLETED") out << " (" << n.outcome().status() << ")";
    if (!n.error().empty() && n.status() != "SKIPPED") out << " - " << n.error();
    out << "\n";
  }

  if (report.recommendations_size() > 0 && max_recommendations > 0) {
    out << "\nRecommendations:\n";
    std::size_t i = 0;
    for (const auto& r : report.recommendations()) {
      if (i == max_recommendations) break;
      out << "  " << ++i << ". " << r << "\n";
    }
  }
  return out.str();
}

std::string ReportWriter::RenderGraph(const FlowGraph& graph) {
  std::ostringstream out;
  out << "\nFlow Dependency Graph:\n\n";

  const auto& layers = graph.Layers();
  for (std::size_t k = 0; k < layers.size(); ++k) {
    out << "  Layer " << k << "\n";
    for (const auto& id : layers[k]) {
      const auto& node = graph.At(id);
      out << "    [" << node.id << "] " << node.name;
      if (!node.dependencies.empty()) {
        out << "  <-";
        for (const auto& dep : node.dependencies) out << " " << dep;
      }
      if (node.skip) out << "  (skipped)";
      out << "\n";
    }
    if (k + 1 < layers.size()) out << "        |\n";
  }
  return out.str();
}

} // namespace flowcheck::flow
