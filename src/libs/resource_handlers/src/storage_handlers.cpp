#include <resource_handlers/aws_handlers.hpp>
#include <diagram_model/properties.hpp>
#include "handler_support.hpp"

namespace resource_handlers {

namespace {

using diagram_model::EdgeKind;
using diagram_model::get_bool;
using diagram_model::get_int;
using diagram_model::get_string;

} // namespace

ValidationReport S3BucketHandler::validate(const Node& node) const {
    ValidationReport report;
    if (get_string(node.properties, "bucket").empty() && node.label.empty()) {
        report.errors.push_back(diagram_model::make_error(diagram_model::IssueType::ValidationError,
            node.id, "bucket name or label is required", "Set properties.bucket or node.label"));
    }
    return report;
}

std::string S3BucketHandler::generate(const Node& node, const Diagram&, const ReferenceMap&) const {
    hcl_writer::File f;
    hcl_writer::Body& body = detail::append_resource(f, resource_type(), node);
    const auto& p = node.properties;

    std::string bucket = get_string(p, "bucket");
    if (bucket.empty()) bucket = node.label;
    body.set_string_if_not_empty("bucket", bucket);

    if (get_bool(p, "versioning"))
        body.append_block("versioning").body().set_bool("enabled", true);
    if (get_bool(p, "block_public_acls"))
        body.append_block("public_access_block").body().set_bool("block_public_acls", true);

    body.set_string_map("tags", detail::name_tags(node));
    return f.bytes();
}

ValidationReport RdsInstanceHandler::validate(const Node& node) const {
    ValidationReport report;
    const auto& p = node.properties;
    detail::require_string(report, node, "engine", "Set properties.engine (e.g. postgres)");
    detail::require_string(report, node, "instance_class", "Set properties.instance_class (e.g. db.t3.micro)");
    if (get_int(p, "allocated_storage") == 0) {
        report.errors.push_back(diagram_model::make_error(diagram_model::IssueType::ValidationError,
            node.id, "allocated_storage is required", "Set properties.allocated_storage (GB)"));
    }
    if (!get_string(p, "password").empty()) {
        report.warnings.push_back(diagram_model::make_warning(node.id,
            "password is stored in plain text in the generated configuration",
            "Use manage_master_user_password or a secrets manager reference"));
    }
    return report;
}

std::string RdsInstanceHandler::generate(const Node& node, const Diagram& diagram,
    const ReferenceMap& references) const
{
    hcl_writer::File f;
    hcl_writer::Body& body = detail::append_resource(f, resource_type(), node);
    const auto& p = node.properties;
    body.set_string_if_not_empty("engine", get_string(p, "engine"));
    body.set_string_if_not_empty("engine_version", get_string(p, "engine_version"));
    body.set_string_if_not_empty("instance_class", get_string(p, "instance_class"));
    body.set_int("allocated_storage", get_int(p, "allocated_storage"));
    body.set_string_if_not_empty("storage_type", get_string(p, "storage_type"));
    body.set_string_if_not_empty("db_name", get_string(p, "db_name"));
    body.set_string_if_not_empty("username", get_string(p, "username"));
    body.set_string_if_not_empty("password", get_string(p, "password"));
    if (get_bool(p, "skip_final_snapshot"))
        body.set_bool("skip_final_snapshot", true);
    if (const int retention = get_int(p, "backup_retention_period"); retention > 0)
        body.set_int("backup_retention_period", retention);
    body.set_bool("multi_az", get_bool(p, "multi_az"));

    if (const std::string* group = detail::incoming_reference(diagram, node, EdgeKind::Contains, references,
            "db_subnet_group"))
        body.set_traversal("db_subnet_group_name", resource_registry::reference_to(*group, "name"));

    std::vector<std::string> groups;
    for (const auto& addr : detail::incoming_references(diagram, node, EdgeKind::ConnectsTo, references))
        groups.push_back(resource_registry::reference_to(addr, "id"));
    if (!groups.empty())
        body.set_traversal_list("vpc_security_group_ids", groups);

    body.set_string_map("tags", detail::name_tags(node));
    return f.bytes();
}

} // namespace resource_handlers
