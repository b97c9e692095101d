#include "handler_support.hpp"
#include <diagram_model/properties.hpp>

namespace resource_handlers::detail {

void require_string(resource_registry::ValidationReport& report, const diagram_model::Node& node,
    const std::string& key, const std::string& suggestion)
{
    if (!diagram_model::get_string(node.properties, key).empty()) return;
    report.errors.push_back(diagram_model::make_error(diagram_model::IssueType::ValidationError,
        node.id, key + " is required", suggestion));
}

std::map<std::string, std::string> name_tags(const diagram_model::Node& node) {
    auto tags = diagram_model::get_string_map(node.properties, "tags");
    if (!node.label.empty() && tags.count("Name") == 0)
        tags["Name"] = node.label;
    return tags;
}

const std::string* incoming_reference(const diagram_model::Diagram& diagram,
    const diagram_model::Node& node,
    diagram_model::EdgeKind edge_kind,
    const resource_registry::ReferenceMap& references,
    const std::string& source_kind)
{
    for (const diagram_model::Edge* e : diagram_model::edges_with_target(diagram, node.id)) {
        if (e->kind != edge_kind) continue;
        if (!source_kind.empty()) {
            const diagram_model::Node* source = diagram_model::find_node(diagram, e->source_node_id);
            if (!source || source->kind != source_kind) continue;
        }
        if (const std::string* addr = references.find(e->source_node_id)) return addr;
    }
    return nullptr;
}

std::vector<std::string> incoming_references(const diagram_model::Diagram& diagram,
    const diagram_model::Node& node,
    diagram_model::EdgeKind edge_kind,
    const resource_registry::ReferenceMap& references)
{
    std::vector<std::string> out;
    for (const diagram_model::Edge* e : diagram_model::edges_with_target(diagram, node.id)) {
        if (e->kind != edge_kind) continue;
        if (const std::string* addr = references.find(e->source_node_id)) out.push_back(*addr);
    }
    return out;
}

hcl_writer::Body& append_resource(hcl_writer::File& file, const std::string& type,
    const diagram_model::Node& node)
{
    return file.body().append_block("resource", { type, hcl_writer::sanitize_name(node.id) }).body();
}

} // namespace resource_handlers::detail
