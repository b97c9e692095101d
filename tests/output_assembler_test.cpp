#include <hcl_writer/output_assembler.hpp>
#include <hcl_writer/templates.hpp>
#include <gtest/gtest.h>
#include "test_diagrams.hpp"

namespace hw = hcl_writer;
using test_support::contains;

TEST(OutputAssemblerTest, JoinsFragmentsWithOneBlankLine) {
    hw::OutputAssembler assembler;
    assembler.add_resource("resource \"a\" \"x\" {\n}\n");
    assembler.add_resource("");
    assembler.add_resource("resource \"b\" \"y\" {\n}");
    assembler.add_resource("resource \"c\" \"z\" {\n}\n");
    EXPECT_EQ(assembler.resource_count(), 3u);

    const auto files = assembler.build();
    ASSERT_EQ(files.count(hw::kMainFile), 1u);
    EXPECT_EQ(files.at(hw::kMainFile),
        "resource \"a\" \"x\" {\n}\n"
        "\n"
        "resource \"b\" \"y\" {\n}\n"
        "\n"
        "resource \"c\" \"z\" {\n}\n");
}

TEST(OutputAssemblerTest, OmitsEmptySections) {
    hw::OutputAssembler assembler;
    assembler.set_versions("terraform {}\n");
    const auto files = assembler.build();
    EXPECT_EQ(files.size(), 1u);
    EXPECT_EQ(files.count(hw::kVersionsFile), 1u);
}

TEST(OutputAssemblerTest, TfvarsOnlyWhenEnabled) {
    hw::OutputAssembler with(true);
    with.set_tfvars("aws_region = \"us-east-1\"\n");
    EXPECT_EQ(with.build().count(hw::kTfvarsFile), 1u);

    hw::OutputAssembler without(false);
    without.set_tfvars("aws_region = \"us-east-1\"\n");
    EXPECT_EQ(without.build().count(hw::kTfvarsFile), 0u);
}

TEST(TemplatesTest, VersionsPinsAwsProvider) {
    const std::string versions = hw::versions_tf();
    EXPECT_TRUE(contains(versions, "required_version = \">= 1.0\""));
    EXPECT_TRUE(contains(versions, "source  = \"hashicorp/aws\""));
    EXPECT_TRUE(contains(versions, "version = \"~> 5.0\""));
    EXPECT_TRUE(contains(versions, "provider \"aws\" {\n  region = var.aws_region\n}\n"));
}

TEST(TemplatesTest, VariablesIncludeEnvironmentOnlyWhenSet) {
    diagram_model::Metadata meta;
    const std::string plain = hw::variables_tf("eu-west-1", meta);
    EXPECT_TRUE(contains(plain, "variable \"aws_region\" {"));
    EXPECT_TRUE(contains(plain, "default     = \"eu-west-1\""));
    EXPECT_FALSE(contains(plain, "environment"));

    meta.environment = "staging";
    const std::string with_env = hw::variables_tf("eu-west-1", meta);
    EXPECT_TRUE(contains(with_env, "variable \"environment\" {"));
    EXPECT_TRUE(contains(with_env, "\"staging\""));
}

TEST(TemplatesTest, OutputsFollowReferenceOrder) {
    const std::string outputs = hw::outputs_tf({
        { "main-vpc", "aws_vpc.main_vpc" },
        { "web", "aws_instance.web" },
    });
    EXPECT_EQ(outputs,
        "output \"main_vpc_id\" {\n"
        "  value = aws_vpc.main_vpc.id\n"
        "}\n"
        "\n"
        "output \"web_id\" {\n"
        "  value = aws_instance.web.id\n"
        "}\n");
    EXPECT_EQ(hw::outputs_tf({}), "");
}

TEST(TemplatesTest, TfvarsFromMetadata) {
    diagram_model::Metadata meta;
    EXPECT_EQ(hw::tfvars_from_metadata("us-west-2", meta), "aws_region = \"us-west-2\"\n");
    meta.environment = "prod";
    EXPECT_EQ(hw::tfvars_from_metadata("us-west-2", meta),
        "aws_region  = \"us-west-2\"\n"
        "environment = \"prod\"\n");
}
