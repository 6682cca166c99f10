#include "json_text.hpp"

#include <google/protobuf/util/json_util.h>

namespace flowcheck::checks {

std::optional<google::protobuf::Value> ParseJson(std::string_view text, std::string* error) {
  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &value);
  if (!status.ok()) {
    if (error) *error = std::string(status.message());
    return std::nullopt;
  }
  return value;
}

std::optional<std::vector<std::string>> ParseIdList(std::string_view text) {
  auto value = ParseJson(text);
  if (!value || !value->has_list_value()) return std::nullopt;

  std::vector<std::string> ids;
  for (const auto& v : value->list_value().values()) {
    if (v.kind_case() == google::protobuf::Value::kStringValue) ids.push_back(v.string_value());
  }
  return ids;
}

} // namespace flowcheck::checks
