#include <diagram_model/types.hpp>
#include <diagram_model/issue.hpp>

namespace diagram_model {

const char* to_string(EdgeKind kind) {
    switch (kind) {
    case EdgeKind::Contains: return "contains";
    case EdgeKind::ConnectsTo: return "connects_to";
    case EdgeKind::DependsOn: return "depends_on";
    }
    return "depends_on";
}

EdgeKind edge_kind_from_string(const std::string& s) {
    if (s == "contains") return EdgeKind::Contains;
    if (s == "connects_to") return EdgeKind::ConnectsTo;
    return EdgeKind::DependsOn;
}

const char* to_string(IssueType type) {
    switch (type) {
    case IssueType::SchemaError: return "schema_error";
    case IssueType::DependencyError: return "dependency_error";
    case IssueType::ValidationError: return "validation_error";
    case IssueType::GenerationError: return "generation_error";
    case IssueType::UnsupportedKind: return "unsupported_kind";
    case IssueType::BestPractice: return "best_practice";
    }
    return "validation_error";
}

const char* to_string(Severity severity) {
    return severity == Severity::Warning ? "warning" : "error";
}

const Node* find_node(const Diagram& diagram, const std::string& id) {
    for (const auto& n : diagram.nodes) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

std::vector<const Edge*> edges_with_target(const Diagram& diagram, const std::string& target_id) {
    std::vector<const Edge*> out;
    for (const auto& e : diagram.edges) {
        if (e.target_node_id == target_id) out.push_back(&e);
    }
    return out;
}

std::vector<const Edge*> edges_with_source(const Diagram& diagram, const std::string& source_id) {
    std::vector<const Edge*> out;
    for (const auto& e : diagram.edges) {
        if (e.source_node_id == source_id) out.push_back(&e);
    }
    return out;
}

} // namespace diagram_model
