#include <resource_handlers/aws_handlers.hpp>
#include <diagram_model/properties.hpp>
#include "handler_support.hpp"
#include <initializer_list>
#include <string>

namespace resource_handlers {

namespace {

using diagram_model::EdgeKind;
using diagram_model::get_bool;
using diagram_model::get_string;

bool covers_port(const nlohmann::json& rule, int port) {
    const int from = diagram_model::get_int(rule, "from_port");
    const int to = diagram_model::get_int(rule, "to_port");
    return from <= port && port <= to;
}

bool open_to_world(const nlohmann::json& rule) {
    for (const auto& c : diagram_model::get_array(rule, "cidr_blocks")) {
        if (c.is_string() && c.get<std::string>() == "0.0.0.0/0") return true;
    }
    return false;
}

void append_rules(hcl_writer::Body& body, const char* block_type, const nlohmann::json& rules) {
    for (const auto& rule : rules) {
        // Reported by validate().
        if (!rule.is_object()) continue;
        hcl_writer::Body& rb = body.append_block(block_type).body();
        if (rule.contains("from_port") && rule["from_port"].is_number())
            rb.set_int("from_port", diagram_model::get_int(rule, "from_port"));
        if (rule.contains("to_port") && rule["to_port"].is_number())
            rb.set_int("to_port", diagram_model::get_int(rule, "to_port"));
        if (rule.contains("protocol") && rule["protocol"].is_string())
            rb.set_string("protocol", rule["protocol"].get<std::string>());
        std::vector<std::string> cidrs;
        for (const auto& c : diagram_model::get_array(rule, "cidr_blocks")) {
            if (c.is_string()) cidrs.push_back(c.get<std::string>());
        }
        if (!cidrs.empty()) rb.set_string_list("cidr_blocks", cidrs);
    }
}

} // namespace

ValidationReport VpcHandler::validate(const Node& node) const {
    ValidationReport report;
    detail::require_string(report, node, "cidr_block", "Set properties.cidr_block (e.g. 10.0.0.0/16)");
    return report;
}

std::string VpcHandler::generate(const Node& node, const Diagram&, const ReferenceMap&) const {
    hcl_writer::File f;
    hcl_writer::Body& body = detail::append_resource(f, resource_type(), node);
    const auto& p = node.properties;
    body.set_string_if_not_empty("cidr_block", get_string(p, "cidr_block"));
    body.set_bool("enable_dns_hostnames", get_bool(p, "enable_dns_hostnames"));
    body.set_bool("enable_dns_support", get_bool(p, "enable_dns_support"));
    body.set_string_map("tags", detail::name_tags(node));
    return f.bytes();
}

ValidationReport SubnetHandler::validate(const Node& node) const {
    ValidationReport report;
    detail::require_string(report, node, "cidr_block", "Set properties.cidr_block");
    return report;
}

std::string SubnetHandler::generate(const Node& node, const Diagram& diagram,
    const ReferenceMap& references) const
{
    hcl_writer::File f;
    hcl_writer::Body& body = detail::append_resource(f, resource_type(), node);
    const auto& p = node.properties;
    body.set_string_if_not_empty("cidr_block", get_string(p, "cidr_block"));
    body.set_string_if_not_empty("availability_zone", get_string(p, "availability_zone"));
    if (const std::string* vpc = detail::incoming_reference(diagram, node, EdgeKind::Contains, references))
        body.set_traversal("vpc_id", resource_registry::reference_to(*vpc, "id"));
    body.set_string_map("tags", detail::name_tags(node));
    return f.bytes();
}

ValidationReport SecurityGroupHandler::validate(const Node& node) const {
    ValidationReport report;
    const auto& p = node.properties;
    if (get_string(p, "name").empty() && node.label.empty()) {
        report.errors.push_back(diagram_model::make_error(diagram_model::IssueType::ValidationError,
            node.id, "name or label is required", "Set properties.name or node.label"));
    }
    for (const char* direction : { "ingress", "egress" }) {
        const auto& rules = diagram_model::get_array(p, direction);
        for (std::size_t i = 0; i < rules.size(); ++i) {
            if (rules[i].is_object()) continue;
            report.errors.push_back(diagram_model::make_error(diagram_model::IssueType::ValidationError,
                node.id, std::string(direction) + " rule " + std::to_string(i) + " is not an object",
                "Write each rule as {\"from_port\", \"to_port\", \"protocol\", \"cidr_blocks\"}"));
        }
    }
    for (const auto& rule : diagram_model::get_array(p, "ingress")) {
        if (!rule.is_object()) continue;
        if (open_to_world(rule) && covers_port(rule, 22)) {
            report.warnings.push_back(diagram_model::make_warning(node.id,
                "ingress allows SSH (port 22) from 0.0.0.0/0",
                "Restrict cidr_blocks to a trusted range"));
        }
    }
    return report;
}

std::string SecurityGroupHandler::generate(const Node& node, const Diagram& diagram,
    const ReferenceMap& references) const
{
    hcl_writer::File f;
    hcl_writer::Body& body = detail::append_resource(f, resource_type(), node);
    const auto& p = node.properties;

    std::string sg_name = get_string(p, "name");
    if (sg_name.empty()) sg_name = node.label;
    body.set_string_if_not_empty("name", sg_name);
    body.set_string_if_not_empty("description", get_string(p, "description"));
    if (const std::string* vpc = detail::incoming_reference(diagram, node, EdgeKind::Contains, references))
        body.set_traversal("vpc_id", resource_registry::reference_to(*vpc, "id"));

    append_rules(body, "ingress", diagram_model::get_array(p, "ingress"));
    append_rules(body, "egress", diagram_model::get_array(p, "egress"));
    if (!diagram_model::has_key(p, "egress")) {
        // Allow all outbound unless the diagram says otherwise.
        hcl_writer::Body& eg = body.append_block("egress").body();
        eg.set_int("from_port", 0);
        eg.set_int("to_port", 0);
        eg.set_string("protocol", "-1");
        eg.set_string_list("cidr_blocks", { "0.0.0.0/0" });
    }

    body.set_string_map("tags", detail::name_tags(node));
    return f.bytes();
}

} // namespace resource_handlers
