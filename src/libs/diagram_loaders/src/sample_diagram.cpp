#include <diagram_loaders/sample_diagram.hpp>
#include <string>
#include <utility>

namespace diagram_loaders {

diagram_model::Diagram generate_sample_diagram() {
    diagram_model::Diagram out;
    out.metadata.version = "1.0";
    out.metadata.name = "Web application stack (sample)";
    out.metadata.description = "VPC with public/private subnets, web tier, database and assets";
    out.metadata.environment = "dev";

    double next_y = 40;
    auto add_node = [&](const char* id, const char* kind, const char* label, nlohmann::json props) {
        diagram_model::Node n;
        n.id = id;
        n.kind = kind;
        n.label = label;
        n.position = { 60, next_y };
        n.properties = std::move(props);
        next_y += 120;
        out.nodes.push_back(std::move(n));
    };
    int edge_seq = 0;
    auto add_edge = [&](const char* source, const char* target, diagram_model::EdgeKind kind) {
        diagram_model::Edge e;
        e.id = "edge-" + std::to_string(++edge_seq);
        e.source_node_id = source;
        e.target_node_id = target;
        e.kind = kind;
        out.edges.push_back(std::move(e));
    };

    add_node("main-vpc", "vpc", "Main VPC", {
        { "cidr_block", "10.0.0.0/16" },
        { "enable_dns_hostnames", true },
        { "enable_dns_support", true },
        { "tags", { { "Environment", "dev" } } } });
    add_node("public-subnet", "subnet", "Public Subnet", {
        { "cidr_block", "10.0.1.0/24" }, { "availability_zone", "us-east-1a" } });
    add_node("private-subnet", "subnet", "Private Subnet", {
        { "cidr_block", "10.0.2.0/24" }, { "availability_zone", "us-east-1b" } });
    add_node("web-sg", "security_group", "Web SG", {
        { "description", "Allow HTTPS from anywhere" },
        { "ingress", nlohmann::json::array({
            { { "from_port", 443 }, { "to_port", 443 }, { "protocol", "tcp" },
              { "cidr_blocks", nlohmann::json::array({ "0.0.0.0/0" }) } } }) } });
    add_node("web-server", "ec2_instance", "Web Server", {
        { "ami", "ami-0c55b159cbfafe1f0" }, { "instance_type", "t3.micro" } });
    add_node("app-db", "rds_instance", "App Database", {
        { "engine", "postgres" }, { "engine_version", "15.4" },
        { "instance_class", "db.t3.micro" }, { "allocated_storage", 20 },
        { "db_name", "app" }, { "username", "app_admin" },
        { "skip_final_snapshot", true } });
    add_node("thumbnailer", "lambda_function", "Thumbnailer", {
        { "runtime", "python3.12" }, { "handler", "main.handler" },
        { "filename", "thumbnailer.zip" }, { "memory_size", 256 },
        { "environment_variables", { { "BUCKET", "sample-assets" } } } });
    add_node("assets", "s3_bucket", "Assets", {
        { "bucket", "sample-assets" }, { "versioning", true } });

    using diagram_model::EdgeKind;
    add_edge("main-vpc", "public-subnet", EdgeKind::Contains);
    add_edge("main-vpc", "private-subnet", EdgeKind::Contains);
    add_edge("main-vpc", "web-sg", EdgeKind::Contains);
    add_edge("public-subnet", "web-server", EdgeKind::Contains);
    add_edge("web-sg", "web-server", EdgeKind::ConnectsTo);
    add_edge("web-sg", "app-db", EdgeKind::ConnectsTo);
    add_edge("private-subnet", "app-db", EdgeKind::DependsOn);
    add_edge("assets", "thumbnailer", EdgeKind::DependsOn);

    return out;
}

} // namespace diagram_loaders
