#include <hcl_writer/hcl.hpp>
#include <gtest/gtest.h>

namespace hw = hcl_writer;

TEST(HclQuoteTest, EscapesSpecialCharacters) {
    EXPECT_EQ(hw::quote("plain"), "\"plain\"");
    EXPECT_EQ(hw::quote("say \"hi\""), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(hw::quote("a\\b"), "\"a\\\\b\"");
    EXPECT_EQ(hw::quote("line\nnext\ttab"), "\"line\\nnext\\ttab\"");
    EXPECT_EQ(hw::quote("${var.x}"), "\"$${var.x}\"");
    EXPECT_EQ(hw::quote("%{if}"), "\"%%{if}\"");
    EXPECT_EQ(hw::quote("cost $5 or 10%"), "\"cost $5 or 10%\"");
}

TEST(HclNamesTest, SanitizeAndIdentifier) {
    EXPECT_EQ(hw::sanitize_name("main-vpc-1"), "main_vpc_1");
    EXPECT_EQ(hw::sanitize_name("already_ok"), "already_ok");
    EXPECT_TRUE(hw::is_identifier("Name"));
    EXPECT_TRUE(hw::is_identifier("_x-1"));
    EXPECT_FALSE(hw::is_identifier("1abc"));
    EXPECT_FALSE(hw::is_identifier("has space"));
    EXPECT_FALSE(hw::is_identifier(""));
}

TEST(HclBodyTest, AlignsConsecutiveAttributes) {
    hw::File f;
    hw::Body& body = f.body().append_block("resource", { "aws_vpc", "main" }).body();
    body.set_string("cidr_block", "10.0.0.0/16");
    body.set_bool("enable_dns_hostnames", true);
    body.set_string_map("tags", { { "Name", "Main" }, { "Cost Center", "42" } });

    const std::string expected =
        "resource \"aws_vpc\" \"main\" {\n"
        "  cidr_block           = \"10.0.0.0/16\"\n"
        "  enable_dns_hostnames = true\n"
        "  tags                 = {\n"
        "    \"Cost Center\" = \"42\"\n"
        "    Name          = \"Main\"\n"
        "  }\n"
        "}\n";
    EXPECT_EQ(f.bytes(), expected);
}

TEST(HclBodyTest, BlocksAndObjectsBreakAlignmentRuns) {
    hw::File f;
    hw::Body& body = f.body().append_block("resource", { "aws_instance", "web" }).body();
    body.set_string("ami", "ami-1");
    hw::Body& nested = body.append_block("root_block_device").body();
    nested.set_int("volume_size", 20);
    body.set_string("instance_type", "t3.micro");

    const std::string expected =
        "resource \"aws_instance\" \"web\" {\n"
        "  ami = \"ami-1\"\n"
        "  root_block_device {\n"
        "    volume_size = 20\n"
        "  }\n"
        "  instance_type = \"t3.micro\"\n"
        "}\n";
    EXPECT_EQ(f.bytes(), expected);
}

TEST(HclBodyTest, ListsAndTraversals) {
    hw::File f;
    hw::Body& body = f.body();
    body.set_traversal("vpc_id", "aws_vpc.main.id");
    body.set_string_list("cidrs", { "10.0.0.0/8", "192.168.0.0/16" });
    body.set_traversal_list("groups", { "aws_security_group.a.id" });
    body.set_string_list("empty", {});

    const std::string expected =
        "vpc_id = aws_vpc.main.id\n"
        "cidrs  = [\"10.0.0.0/8\", \"192.168.0.0/16\"]\n"
        "groups = [aws_security_group.a.id]\n"
        "empty  = []\n";
    EXPECT_EQ(f.bytes(), expected);
}

TEST(HclBodyTest, OptionalSettersSkipEmptyValues) {
    hw::File f;
    f.body().set_string_if_not_empty("name", "");
    f.body().set_string_map("tags", {});
    EXPECT_TRUE(f.body().empty());
    EXPECT_EQ(f.bytes(), "");
}

TEST(HclBodyTest, NewlineSeparatesTopLevelBlocks) {
    hw::File f;
    f.body().append_block("output", { "a_id" }).body().set_traversal("value", "aws_vpc.a.id");
    f.body().append_newline();
    f.body().append_block("output", { "b_id" }).body().set_traversal("value", "aws_vpc.b.id");

    const std::string expected =
        "output \"a_id\" {\n"
        "  value = aws_vpc.a.id\n"
        "}\n"
        "\n"
        "output \"b_id\" {\n"
        "  value = aws_vpc.b.id\n"
        "}\n";
    EXPECT_EQ(f.bytes(), expected);
}
