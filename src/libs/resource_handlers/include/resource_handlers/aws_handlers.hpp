#pragma once

#include <resource_registry/registry.hpp>
#include <resource_registry/resource_handler.hpp>
#include <string>

namespace resource_handlers {

using diagram_model::Diagram;
using diagram_model::Node;
using resource_registry::ReferenceMap;
using resource_registry::ValidationReport;

class VpcHandler final : public resource_registry::ResourceHandler {
public:
    std::string resource_kind() const override { return "vpc"; }
    std::string resource_type() const override { return "aws_vpc"; }
    ValidationReport validate(const Node& node) const override;
    std::string generate(const Node& node, const Diagram& diagram, const ReferenceMap& references) const override;
};

// vpc_id from the incoming "contains" edge.
class SubnetHandler final : public resource_registry::ResourceHandler {
public:
    std::string resource_kind() const override { return "subnet"; }
    std::string resource_type() const override { return "aws_subnet"; }
    ValidationReport validate(const Node& node) const override;
    std::string generate(const Node& node, const Diagram& diagram, const ReferenceMap& references) const override;
};

class SecurityGroupHandler final : public resource_registry::ResourceHandler {
public:
    std::string resource_kind() const override { return "security_group"; }
    std::string resource_type() const override { return "aws_security_group"; }
    ValidationReport validate(const Node& node) const override;
    std::string generate(const Node& node, const Diagram& diagram, const ReferenceMap& references) const override;
};

// subnet_id from a "contains" edge out of a subnet; security groups from "connects_to".
class Ec2InstanceHandler final : public resource_registry::ResourceHandler {
public:
    std::string resource_kind() const override { return "ec2_instance"; }
    std::string resource_type() const override { return "aws_instance"; }
    ValidationReport validate(const Node& node) const override;
    std::string generate(const Node& node, const Diagram& diagram, const ReferenceMap& references) const override;
};

class LambdaFunctionHandler final : public resource_registry::ResourceHandler {
public:
    std::string resource_kind() const override { return "lambda_function"; }
    std::string resource_type() const override { return "aws_lambda_function"; }
    ValidationReport validate(const Node& node) const override;
    std::string generate(const Node& node, const Diagram& diagram, const ReferenceMap& references) const override;
};

class S3BucketHandler final : public resource_registry::ResourceHandler {
public:
    std::string resource_kind() const override { return "s3_bucket"; }
    std::string resource_type() const override { return "aws_s3_bucket"; }
    ValidationReport validate(const Node& node) const override;
    std::string generate(const Node& node, const Diagram& diagram, const ReferenceMap& references) const override;
};

class RdsInstanceHandler final : public resource_registry::ResourceHandler {
public:
    std::string resource_kind() const override { return "rds_instance"; }
    std::string resource_type() const override { return "aws_db_instance"; }
    ValidationReport validate(const Node& node) const override;
    std::string generate(const Node& node, const Diagram& diagram, const ReferenceMap& references) const override;
};

// Installs every handler above under its resource_kind(). Existing
// registrations for the same kinds are replaced.
void register_builtin_handlers(resource_registry::Registry& registry);

} // namespace resource_handlers
