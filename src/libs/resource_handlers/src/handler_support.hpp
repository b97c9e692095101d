#pragma once

#include <diagram_model/issue.hpp>
#include <diagram_model/types.hpp>
#include <hcl_writer/hcl.hpp>
#include <resource_registry/reference_map.hpp>
#include <resource_registry/resource_handler.hpp>
#include <map>
#include <string>
#include <vector>

namespace resource_handlers::detail {

// Appends a validation_error when props[key] is missing or an empty string.
void require_string(resource_registry::ValidationReport& report, const diagram_model::Node& node,
    const std::string& key, const std::string& suggestion);

// tags property plus Name = label when a label is set and Name is not tagged yet.
std::map<std::string, std::string> name_tags(const diagram_model::Node& node);

// Address of the first source of an incoming edge of the given kind that has
// already been generated. source_kind filters on the source node's kind when non-empty.
const std::string* incoming_reference(const diagram_model::Diagram& diagram,
    const diagram_model::Node& node,
    diagram_model::EdgeKind edge_kind,
    const resource_registry::ReferenceMap& references,
    const std::string& source_kind = {});

// Addresses of every generated source of an incoming edge of the given kind, in edge order.
std::vector<std::string> incoming_references(const diagram_model::Diagram& diagram,
    const diagram_model::Node& node,
    diagram_model::EdgeKind edge_kind,
    const resource_registry::ReferenceMap& references);

// Appends resource "<type>" "<sanitized node id>" to file and returns its body.
hcl_writer::Body& append_resource(hcl_writer::File& file, const std::string& type,
    const diagram_model::Node& node);

} // namespace resource_handlers::detail
