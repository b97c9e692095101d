#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace diagram_model {

struct Metadata {
    std::string version;
    std::string name;
    std::string description;
    std::string environment;
};

// Editor coordinates; carried through but not used by generation.
struct Position {
    double x = 0;
    double y = 0;
};

struct Node {
    std::string id;
    std::string kind; // selects the resource handler ("vpc", "subnet", ...)
    std::string label;
    Position position;
    nlohmann::json properties = nlohmann::json::object();
};

enum class EdgeKind { Contains, ConnectsTo, DependsOn };

struct Edge {
    std::string id;
    std::string source_node_id;
    std::string target_node_id;
    EdgeKind kind = EdgeKind::DependsOn;
    nlohmann::json properties = nlohmann::json::object();
};

struct Diagram {
    Metadata metadata;
    std::vector<Node> nodes;
    std::vector<Edge> edges;
};

const char* to_string(EdgeKind kind);
// Unknown or empty strings map to DependsOn.
EdgeKind edge_kind_from_string(const std::string& s);

const Node* find_node(const Diagram& diagram, const std::string& id);
std::vector<const Edge*> edges_with_target(const Diagram& diagram, const std::string& target_id);
std::vector<const Edge*> edges_with_source(const Diagram& diagram, const std::string& source_id);

} // namespace diagram_model
