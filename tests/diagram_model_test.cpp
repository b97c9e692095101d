#include <diagram_model/properties.hpp>
#include <diagram_model/validate.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include "test_diagrams.hpp"

namespace dm = diagram_model;
using test_support::make_diagram;
using test_support::make_edge;
using test_support::make_node;

TEST(DiagramModelTest, EdgeKindNamesRoundTrip) {
    EXPECT_EQ(dm::edge_kind_from_string("contains"), dm::EdgeKind::Contains);
    EXPECT_EQ(dm::edge_kind_from_string("connects_to"), dm::EdgeKind::ConnectsTo);
    EXPECT_EQ(dm::edge_kind_from_string("depends_on"), dm::EdgeKind::DependsOn);
    EXPECT_EQ(dm::edge_kind_from_string(""), dm::EdgeKind::DependsOn);
    EXPECT_EQ(dm::edge_kind_from_string("peers_with"), dm::EdgeKind::DependsOn);
    EXPECT_STREQ(dm::to_string(dm::EdgeKind::ConnectsTo), "connects_to");
}

TEST(DiagramModelTest, IssueNames) {
    EXPECT_STREQ(dm::to_string(dm::IssueType::SchemaError), "schema_error");
    EXPECT_STREQ(dm::to_string(dm::IssueType::UnsupportedKind), "unsupported_kind");
    EXPECT_STREQ(dm::to_string(dm::Severity::Warning), "warning");

    const dm::Issue w = dm::make_warning("n1", "careful");
    EXPECT_EQ(w.type, dm::IssueType::BestPractice);
    EXPECT_EQ(w.severity, dm::Severity::Warning);
}

TEST(DiagramModelTest, EdgeLookupsFollowDeclarationOrder) {
    auto d = make_diagram();
    d.nodes = { make_node("a", "vpc"), make_node("b", "subnet"), make_node("c", "subnet") };
    d.edges = { make_edge("a", "b"), make_edge("c", "b"), make_edge("a", "c") };

    ASSERT_NE(dm::find_node(d, "b"), nullptr);
    EXPECT_EQ(dm::find_node(d, "missing"), nullptr);

    const auto into_b = dm::edges_with_target(d, "b");
    ASSERT_EQ(into_b.size(), 2u);
    EXPECT_EQ(into_b[0]->source_node_id, "a");
    EXPECT_EQ(into_b[1]->source_node_id, "c");
    EXPECT_EQ(dm::edges_with_source(d, "a").size(), 2u);
}

TEST(PropertiesTest, TypedReadsNeverThrow) {
    const nlohmann::json p = {
        { "name", "web" }, { "flag", true }, { "count", 3 }, { "ratio", 2.9 },
        { "tags", { { "Team", "infra" }, { "Cost", 12 } } }, { "list", { 1, 2 } } };

    EXPECT_EQ(dm::get_string(p, "name"), "web");
    EXPECT_EQ(dm::get_string(p, "count"), "");
    EXPECT_EQ(dm::get_string(p, "absent"), "");
    EXPECT_TRUE(dm::get_bool(p, "flag"));
    EXPECT_FALSE(dm::get_bool(p, "name"));
    EXPECT_EQ(dm::get_int(p, "count"), 3);
    EXPECT_EQ(dm::get_int(p, "ratio"), 2);
    EXPECT_EQ(dm::get_int(p, "name"), 0);

    const auto tags = dm::get_string_map(p, "tags");
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags.at("Team"), "infra");

    EXPECT_EQ(dm::get_array(p, "list").size(), 2u);
    EXPECT_TRUE(dm::get_array(p, "name").empty());
    EXPECT_TRUE(dm::has_key(p, "list"));
    EXPECT_FALSE(dm::has_key(nlohmann::json::array(), "list"));
}

TEST(PropertiesTest, GetIntClampsOutOfRangeNumbers) {
    const nlohmann::json p = {
        { "huge_float", 1e20 }, { "tiny_float", -1e20 },
        { "past_uint32", 4294967296LL }, { "below_int", -4294967296LL },
        { "max_uint64", std::numeric_limits<std::uint64_t>::max() },
        { "wraps_negative", 3000000000LL } };

    EXPECT_EQ(dm::get_int(p, "huge_float"), std::numeric_limits<int>::max());
    EXPECT_EQ(dm::get_int(p, "tiny_float"), std::numeric_limits<int>::min());
    EXPECT_EQ(dm::get_int(p, "past_uint32"), std::numeric_limits<int>::max());
    EXPECT_EQ(dm::get_int(p, "below_int"), std::numeric_limits<int>::min());
    EXPECT_EQ(dm::get_int(p, "max_uint64"), std::numeric_limits<int>::max());
    EXPECT_EQ(dm::get_int(p, "wraps_negative"), std::numeric_limits<int>::max());
}

TEST(ValidateDiagramTest, WellFormedDiagramHasNoIssues) {
    auto d = make_diagram();
    d.nodes = { make_node("a", "vpc"), make_node("b", "subnet") };
    d.edges = { make_edge("a", "b", dm::EdgeKind::Contains) };
    EXPECT_TRUE(dm::validate_diagram(d).empty());
}

TEST(ValidateDiagramTest, ReportsEveryStructuralProblem) {
    dm::Diagram d; // no version
    d.nodes = { make_node("", "vpc"), make_node("a", ""), make_node("a", "vpc") };
    d.edges = { make_edge("a", ""), make_edge("ghost", "a"), make_edge("a", "phantom") };

    const auto issues = dm::validate_diagram(d);
    std::vector<std::string> messages;
    for (const auto& i : issues) {
        EXPECT_EQ(i.type, dm::IssueType::SchemaError);
        EXPECT_EQ(i.severity, dm::Severity::Error);
        messages.push_back(i.message);
    }
    const std::vector<std::string> expected = {
        "metadata.version is required",
        "node at index 0 has empty id",
        "node.type is required",
        "duplicate node id: a",
        "edge at index 0 must have source and target",
        "edge source node not found: ghost",
        "edge target node not found: phantom",
    };
    EXPECT_EQ(messages, expected);
}
