#include <resource_handlers/aws_handlers.hpp>
#include <diagram_model/properties.hpp>
#include "handler_support.hpp"

namespace resource_handlers {

namespace {

using diagram_model::EdgeKind;
using diagram_model::get_int;
using diagram_model::get_string;

constexpr int kDefaultLambdaMemoryMb = 128;
constexpr int kDefaultLambdaTimeoutSeconds = 3;

std::vector<std::string> id_references(const std::vector<std::string>& addresses) {
    std::vector<std::string> out;
    out.reserve(addresses.size());
    for (const auto& addr : addresses)
        out.push_back(resource_registry::reference_to(addr, "id"));
    return out;
}

} // namespace

ValidationReport Ec2InstanceHandler::validate(const Node& node) const {
    ValidationReport report;
    detail::require_string(report, node, "ami", "Set properties.ami");
    detail::require_string(report, node, "instance_type", "Set properties.instance_type (e.g. t3.micro)");
    return report;
}

std::string Ec2InstanceHandler::generate(const Node& node, const Diagram& diagram,
    const ReferenceMap& references) const
{
    hcl_writer::File f;
    hcl_writer::Body& body = detail::append_resource(f, resource_type(), node);
    const auto& p = node.properties;
    body.set_string_if_not_empty("ami", get_string(p, "ami"));
    body.set_string_if_not_empty("instance_type", get_string(p, "instance_type"));
    body.set_string_if_not_empty("key_name", get_string(p, "key_name"));

    if (const std::string* subnet = detail::incoming_reference(diagram, node, EdgeKind::Contains, references, "subnet"))
        body.set_traversal("subnet_id", resource_registry::reference_to(*subnet, "id"));

    const auto groups = detail::incoming_references(diagram, node, EdgeKind::ConnectsTo, references);
    if (!groups.empty())
        body.set_traversal_list("vpc_security_group_ids", id_references(groups));

    body.set_string_map("tags", detail::name_tags(node));
    return f.bytes();
}

ValidationReport LambdaFunctionHandler::validate(const Node& node) const {
    ValidationReport report;
    detail::require_string(report, node, "runtime", "Set properties.runtime (e.g. python3.9)");
    detail::require_string(report, node, "handler", "Set properties.handler (e.g. index.handler)");
    return report;
}

std::string LambdaFunctionHandler::generate(const Node& node, const Diagram&, const ReferenceMap&) const {
    hcl_writer::File f;
    hcl_writer::Body& body = detail::append_resource(f, resource_type(), node);
    const auto& p = node.properties;
    body.set_string_if_not_empty("runtime", get_string(p, "runtime"));
    body.set_string_if_not_empty("handler", get_string(p, "handler"));

    const int memory = get_int(p, "memory_size");
    body.set_int("memory_size", memory == 0 ? kDefaultLambdaMemoryMb : memory);
    const int timeout = get_int(p, "timeout");
    body.set_int("timeout", timeout == 0 ? kDefaultLambdaTimeoutSeconds : timeout);
    body.set_string_if_not_empty("filename", get_string(p, "filename"));

    std::string function_name = get_string(p, "function_name");
    if (function_name.empty()) function_name = node.label;
    body.set_string_if_not_empty("function_name", function_name);

    const auto env = diagram_model::get_string_map(p, "environment_variables");
    if (!env.empty())
        body.append_block("environment").body().set_string_map("variables", env);

    body.set_string_map("tags", detail::name_tags(node));
    return f.bytes();
}

} // namespace resource_handlers
