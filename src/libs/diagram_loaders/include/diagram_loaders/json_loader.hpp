#pragma once

#include <diagram_model/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <istream>
#include <string>

namespace diagram_loaders {

// Returns nullopt on malformed JSON or a root that is not an object.
// Missing optional fields take their defaults; structural rules are checked
// later by diagram_model::validate_diagram.
std::optional<diagram_model::Diagram> load_diagram_from_json(std::istream& in);
std::optional<diagram_model::Diagram> load_diagram_from_json_string(const std::string& text);
std::optional<diagram_model::Diagram> load_diagram_from_json_file(const std::string& path);

std::optional<diagram_model::Diagram> parse_diagram(const nlohmann::json& j);

} // namespace diagram_loaders
