#pragma once
#include <json/json.h>

#include <string>

namespace wcl {
// Strict parse of a complete HTTP body: trailing garbage is an error.
bool parse_json_body(const std::string& body, Json::Value& root, std::string* err = nullptr);

// Compact single-line rendering, used for nested values kept as text.
std::string to_compact_json(const Json::Value& v);
}  // namespace wcl
