#pragma once

#include <diagram_model/issue.hpp>
#include <diagram_model/types.hpp>
#include <vector>

namespace diagram_model {

// Structural checks only (required fields, unique node ids, edge endpoints).
// Resource-specific checks belong to the handlers. Every returned issue is a
// schema_error; an empty result means the diagram may be resolved.
std::vector<Issue> validate_diagram(const Diagram& diagram);

} // namespace diagram_model
