#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace flowcheck::checks {

// Parses JSON text held in a tracker column. On failure returns nullopt
// and, if given, fills *error with the parser message.
std::optional<google::protobuf::Value> ParseJson(std::string_view text, std::string* error = nullptr);

// String elements of a JSON array column. nullopt if the text is not a
// JSON array; non-string elements are skipped.
std::optional<std::vector<std::string>> ParseIdList(std::string_view text);

} // namespace flowcheck::checks
