#include <dependency_graph/resolver.hpp>
#include <gtest/gtest.h>
#include <set>
#include <unordered_map>
#include "test_diagrams.hpp"

namespace dg = dependency_graph;
using diagram_model::EdgeKind;
using test_support::make_diagram;
using test_support::make_edge;
using test_support::make_node;

namespace {

diagram_model::Diagram web_stack() {
    auto d = make_diagram();
    d.nodes = {
        make_node("app", "ec2_instance"),
        make_node("vpc", "vpc"),
        make_node("sg", "security_group"),
        make_node("subnet", "subnet"),
        make_node("bucket", "s3_bucket"),
    };
    d.edges = {
        make_edge("vpc", "subnet", EdgeKind::Contains),
        make_edge("vpc", "sg", EdgeKind::Contains),
        make_edge("subnet", "app", EdgeKind::Contains),
        make_edge("sg", "app", EdgeKind::ConnectsTo),
    };
    return d;
}

} // namespace

TEST(ResolverTest, OrderedIsPermutationRespectingEdges) {
    const auto d = web_stack();
    const auto r = dg::resolve(d);
    ASSERT_FALSE(r.has_cycle());
    ASSERT_EQ(r.ordered.size(), d.nodes.size());

    std::set<std::string> ids(r.ordered.begin(), r.ordered.end());
    EXPECT_EQ(ids.size(), d.nodes.size());

    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < r.ordered.size(); ++i)
        index[r.ordered[i]] = i;
    for (const auto& e : d.edges)
        EXPECT_LT(index.at(e.source_node_id), index.at(e.target_node_id)) << e.id;
}

TEST(ResolverTest, TiersGroupByDepthInDeclarationOrder) {
    const auto r = dg::resolve(web_stack());
    const std::vector<dg::Tier> expected = {
        { "vpc", "bucket" },
        { "sg", "subnet" },
        { "app" },
    };
    EXPECT_EQ(r.tiers, expected);

    std::vector<std::string> flat;
    for (const auto& t : r.tiers)
        flat.insert(flat.end(), t.begin(), t.end());
    EXPECT_EQ(flat, r.ordered);
}

TEST(ResolverTest, IsDeterministic) {
    const auto d = web_stack();
    const auto first = dg::resolve(d);
    for (int i = 0; i < 20; ++i) {
        const auto again = dg::resolve(d);
        EXPECT_EQ(again.ordered, first.ordered);
        EXPECT_EQ(again.tiers, first.tiers);
    }
}

TEST(ResolverTest, EdgelessDiagramIsOneTier) {
    auto d = make_diagram();
    d.nodes = { make_node("c", "vpc"), make_node("a", "vpc"), make_node("b", "vpc") };
    const auto r = dg::resolve(d);
    ASSERT_EQ(r.tiers.size(), 1u);
    EXPECT_EQ(r.tiers[0], (dg::Tier{ "c", "a", "b" }));
}

TEST(ResolverTest, EmptyDiagramResolvesToNothing) {
    const auto r = dg::resolve(make_diagram());
    EXPECT_FALSE(r.has_cycle());
    EXPECT_TRUE(r.ordered.empty());
    EXPECT_TRUE(r.tiers.empty());
}

TEST(ResolverTest, TwoNodeCycleIsReported) {
    auto d = make_diagram();
    d.nodes = { make_node("A", "vpc"), make_node("B", "subnet") };
    d.edges = { make_edge("A", "B", EdgeKind::Contains), make_edge("B", "A", EdgeKind::Contains) };

    const auto r = dg::resolve(d);
    EXPECT_TRUE(r.has_cycle());
    EXPECT_TRUE(r.tiers.empty());
    EXPECT_TRUE(r.ordered.empty());
    EXPECT_EQ(r.unresolved, (std::vector<std::string>{ "A", "B" }));
}

TEST(ResolverTest, CycleListsOnlyStuckNodes) {
    auto d = make_diagram();
    d.nodes = { make_node("root", "vpc"), make_node("x", "subnet"), make_node("y", "subnet"),
        make_node("free", "s3_bucket") };
    d.edges = { make_edge("root", "x"), make_edge("x", "y"), make_edge("y", "x") };

    const auto r = dg::resolve(d);
    EXPECT_EQ(r.unresolved, (std::vector<std::string>{ "x", "y" }));
}

TEST(ResolverTest, SelfLoopsAndDanglingEdgesAreIgnored) {
    auto d = make_diagram();
    d.nodes = { make_node("a", "vpc"), make_node("b", "subnet") };
    d.edges = { make_edge("a", "a"), make_edge("ghost", "b"), make_edge("a", "b") };

    const auto r = dg::resolve(d);
    ASSERT_FALSE(r.has_cycle());
    EXPECT_EQ(r.tiers, (std::vector<dg::Tier>{ { "a" }, { "b" } }));
}

TEST(ResolverTest, ParallelEdgesReleaseTargetOnce) {
    auto d = make_diagram();
    d.nodes = { make_node("a", "vpc"), make_node("b", "subnet") };
    d.edges = { make_edge("a", "b", EdgeKind::Contains), make_edge("a", "b", EdgeKind::DependsOn) };

    const auto r = dg::resolve(d);
    EXPECT_EQ(r.ordered, (std::vector<std::string>{ "a", "b" }));
}

TEST(ResolverTest, LaterTierSortedByDeclarationNotReleaseOrder) {
    auto d = make_diagram();
    d.nodes = { make_node("late", "subnet"), make_node("p2", "vpc"), make_node("early", "subnet"),
        make_node("p1", "vpc") };
    // p1 comes after p2 in tier 0 but releases "late", which is declared first.
    d.edges = { make_edge("p2", "early"), make_edge("p1", "late") };

    const auto r = dg::resolve(d);
    ASSERT_EQ(r.tiers.size(), 2u);
    EXPECT_EQ(r.tiers[0], (dg::Tier{ "p2", "p1" }));
    EXPECT_EQ(r.tiers[1], (dg::Tier{ "late", "early" }));
}
