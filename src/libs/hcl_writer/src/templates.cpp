#include <hcl_writer/templates.hpp>
#include <hcl_writer/hcl.hpp>

namespace hcl_writer {

namespace {

const char* const kRequiredTerraformVersion = ">= 1.0";
const char* const kAwsProviderSource = "hashicorp/aws";
const char* const kAwsProviderVersion = "~> 5.0";

} // namespace

std::string versions_tf() {
    File f;
    Body& body = f.body();

    Body& tf = body.append_block("terraform").body();
    tf.set_string("required_version", kRequiredTerraformVersion);
    Body& providers = tf.append_block("required_providers").body();
    providers.set_string_map("aws", { { "source", kAwsProviderSource }, { "version", kAwsProviderVersion } });

    body.append_newline();
    Body& provider = body.append_block("provider", { "aws" }).body();
    provider.set_traversal("region", "var.aws_region");

    return f.bytes();
}

std::string variables_tf(const std::string& default_region, const diagram_model::Metadata& metadata) {
    File f;
    Body& body = f.body();

    Body& region = body.append_block("variable", { "aws_region" }).body();
    region.set_string("description", "AWS region");
    region.set_traversal("type", "string");
    region.set_string("default", default_region);

    if (!metadata.environment.empty()) {
        body.append_newline();
        Body& env = body.append_block("variable", { "environment" }).body();
        env.set_string("description", "Deployment environment");
        env.set_traversal("type", "string");
        env.set_string("default", metadata.environment);
    }

    return f.bytes();
}

std::string outputs_tf(const std::vector<std::pair<std::string, std::string>>& references) {
    File f;
    Body& body = f.body();
    bool first = true;
    for (const auto& [node_id, address] : references) {
        if (!first) body.append_newline();
        first = false;
        Body& out = body.append_block("output", { sanitize_name(node_id) + "_id" }).body();
        out.set_traversal("value", address + ".id");
    }
    return f.bytes();
}

std::string tfvars_from_metadata(const std::string& region, const diagram_model::Metadata& metadata) {
    File f;
    Body& body = f.body();
    body.set_string("aws_region", region);
    body.set_string_if_not_empty("environment", metadata.environment);
    return f.bytes();
}

} // namespace hcl_writer
