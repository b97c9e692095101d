#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace diagram_model {

// Typed reads from a node/edge property bag. A missing key or a value of the
// wrong JSON type yields the empty value; none of these throw.

std::string get_string(const nlohmann::json& props, const std::string& key);
bool get_bool(const nlohmann::json& props, const std::string& key);
// JSON numbers are truncated toward zero and clamped to the int range.
int get_int(const nlohmann::json& props, const std::string& key);
// Keeps only string-valued entries. Sorted by key.
std::map<std::string, std::string> get_string_map(const nlohmann::json& props, const std::string& key);
// Returns an empty array when absent or not an array.
const nlohmann::json& get_array(const nlohmann::json& props, const std::string& key);

bool has_key(const nlohmann::json& props, const std::string& key);

} // namespace diagram_model
