#include <resource_registry/reference_map.hpp>
#include <gtest/gtest.h>

namespace rr = resource_registry;

TEST(ReferenceMapTest, KeepsFirstAddressAndInsertionOrder) {
    rr::ReferenceMap refs;
    EXPECT_TRUE(refs.empty());
    EXPECT_TRUE(refs.add("main-vpc", "aws_vpc.main_vpc"));
    EXPECT_TRUE(refs.add("app", "aws_instance.app"));
    EXPECT_FALSE(refs.add("main-vpc", "aws_vpc.other"));

    ASSERT_NE(refs.find("main-vpc"), nullptr);
    EXPECT_EQ(*refs.find("main-vpc"), "aws_vpc.main_vpc");
    EXPECT_EQ(refs.find("ghost"), nullptr);
    EXPECT_TRUE(refs.contains("app"));
    EXPECT_EQ(refs.size(), 2u);

    ASSERT_EQ(refs.entries().size(), 2u);
    EXPECT_EQ(refs.entries()[0].first, "main-vpc");
    EXPECT_EQ(refs.entries()[1].second, "aws_instance.app");
}

TEST(ReferenceMapTest, ReferenceToAppendsAttribute) {
    EXPECT_EQ(rr::reference_to("aws_vpc.main", "id"), "aws_vpc.main.id");
    EXPECT_EQ(rr::reference_to("aws_db_subnet_group.g", "name"), "aws_db_subnet_group.g.name");
    EXPECT_EQ(rr::reference_to("aws_vpc.main", ""), "aws_vpc.main");
}
