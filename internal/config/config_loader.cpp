#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flowcheck::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("123" as a sprint id)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::InvalidConfig("Unsupported YAML node");
  }
}

static FlowConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  FlowConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

FlowConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

FlowConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig("Failed to parse YAML config: " + std::string(e.what()));
  }
  // an empty document is an empty configuration
  if (yaml.IsNull()) return Defaults();
  return ParseYaml(yaml);
}

FlowConfig ConfigLoader::Defaults() {
  FlowConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(FlowConfig& config) {
  auto* validation = config.mutable_validation();
  if (validation->scope().empty()) validation->set_scope("full");
  if (!validation->has_parallel()) validation->set_parallel(true);
  if (validation->max_workers() == 0) validation->set_max_workers(4);
  if (validation->check_timeout_ms() == 0) validation->set_check_timeout_ms(30000);
  if (validation->max_recommendations() == 0) validation->set_max_recommendations(10);

  if (config.probe().sandbox_path().empty()) config.mutable_probe()->set_sandbox_path(":memory:");

  auto* report = config.mutable_report();
  if (report->output_dir().empty()) report->set_output_dir("validation_reports");
  if (report->evidence_dir().empty()) report->set_evidence_dir("evidence");
  if (!report->has_emit_evidence()) report->set_emit_evidence(true);
  if (!report->has_persist()) report->set_persist(true);
}

void ConfigLoader::Validate(const FlowConfig& config) {
  const auto& validation = config.validation();
  if (validation.scope() != "full" && validation.scope() != "quick") {
    throw util::InvalidConfig("validation.scope must be 'full' or 'quick', got '" + validation.scope() + "'");
  }
  if (validation.max_workers() < 1) {
    throw util::InvalidConfig("validation.max_workers must be >= 1");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw util::InvalidConfig("database.postgres.connection_uri is required");
  }
}

} // namespace flowcheck::config
