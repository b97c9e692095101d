#include <diagram_loaders/json_loader.hpp>
#include <fstream>
#include <sstream>

namespace diagram_loaders {

namespace {

std::string string_or_empty(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : "";
}

nlohmann::json properties_or_empty(const nlohmann::json& j) {
    if (j.contains("properties") && j["properties"].is_object()) return j["properties"];
    return nlohmann::json::object();
}

diagram_model::Metadata parse_metadata(const nlohmann::json& m) {
    diagram_model::Metadata meta;
    if (!m.is_object()) return meta;
    meta.version = string_or_empty(m, "version");
    meta.name = string_or_empty(m, "name");
    meta.description = string_or_empty(m, "description");
    meta.environment = string_or_empty(m, "environment");
    return meta;
}

} // namespace

std::optional<diagram_model::Diagram> parse_diagram(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    diagram_model::Diagram d;
    if (j.contains("metadata")) d.metadata = parse_metadata(j["metadata"]);

    if (j.contains("nodes") && j["nodes"].is_array()) {
        for (const auto& n : j["nodes"]) {
            if (!n.is_object()) return std::nullopt;
            diagram_model::Node node;
            node.id = string_or_empty(n, "id");
            node.kind = string_or_empty(n, "type");
            node.label = string_or_empty(n, "label");
            if (n.contains("position") && n["position"].is_object()) {
                const auto& p = n["position"];
                node.position.x = p.contains("x") && p["x"].is_number() ? p["x"].get<double>() : 0;
                node.position.y = p.contains("y") && p["y"].is_number() ? p["y"].get<double>() : 0;
            }
            node.properties = properties_or_empty(n);
            d.nodes.push_back(std::move(node));
        }
    }

    if (j.contains("edges") && j["edges"].is_array()) {
        for (const auto& e : j["edges"]) {
            if (!e.is_object()) return std::nullopt;
            diagram_model::Edge edge;
            edge.id = string_or_empty(e, "id");
            edge.source_node_id = string_or_empty(e, "source");
            edge.target_node_id = string_or_empty(e, "target");
            edge.kind = diagram_model::edge_kind_from_string(string_or_empty(e, "type"));
            edge.properties = properties_or_empty(e);
            d.edges.push_back(std::move(edge));
        }
    }

    return d;
}

std::optional<diagram_model::Diagram> load_diagram_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_diagram(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<diagram_model::Diagram> load_diagram_from_json_string(const std::string& text) {
    std::istringstream in(text);
    return load_diagram_from_json(in);
}

std::optional<diagram_model::Diagram> load_diagram_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_diagram_from_json(f);
}

} // namespace diagram_loaders
