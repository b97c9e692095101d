#include <diagram_model/validate.hpp>
#include <string>
#include <unordered_set>

namespace diagram_model {

std::vector<Issue> validate_diagram(const Diagram& diagram) {
    std::vector<Issue> errs;
    auto schema_error = [&](const std::string& node_id, std::string message, std::string suggestion) {
        errs.push_back(make_error(IssueType::SchemaError, node_id, std::move(message), std::move(suggestion)));
    };

    if (diagram.metadata.version.empty())
        schema_error({}, "metadata.version is required", "Set metadata.version (e.g. \"1.0\")");

    std::unordered_set<std::string> seen_ids;
    for (std::size_t i = 0; i < diagram.nodes.size(); ++i) {
        const Node& n = diagram.nodes[i];
        if (n.id.empty()) {
            schema_error(n.id, "node at index " + std::to_string(i) + " has empty id", "Set node.id");
        } else if (!seen_ids.insert(n.id).second) {
            schema_error(n.id, "duplicate node id: " + n.id, "Use unique ids for each node");
        }
        if (n.kind.empty())
            schema_error(n.id, "node.type is required", "Set node.type (e.g. ec2_instance, vpc)");
    }

    for (std::size_t i = 0; i < diagram.edges.size(); ++i) {
        const Edge& e = diagram.edges[i];
        if (e.source_node_id.empty() || e.target_node_id.empty()) {
            schema_error({}, "edge at index " + std::to_string(i) + " must have source and target",
                "Set edge.source and edge.target to node ids");
        } else if (seen_ids.count(e.source_node_id) == 0) {
            schema_error({}, "edge source node not found: " + e.source_node_id, "Reference an existing node id");
        } else if (seen_ids.count(e.target_node_id) == 0) {
            schema_error({}, "edge target node not found: " + e.target_node_id, "Reference an existing node id");
        }
    }

    return errs;
}

} // namespace diagram_model
