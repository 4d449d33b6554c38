/**
 * @file test_node_set.cpp
 * @brief Tests for the ancestor node set
 */

#include <gtest/gtest.h>
#include "sharetree/NodeSet.hpp"

#include <stdexcept>

using namespace sharetree;

TEST(NodeSetTest, MembershipIsByIdentity) {
    auto a = Node::make_object({{"k", 1}});
    auto b = Node::make_object({{"k", 1}});

    NodeSet set;
    EXPECT_TRUE(set.add(a.get()));
    EXPECT_FALSE(set.add(a.get()));
    EXPECT_TRUE(set.has(a.get()));
    EXPECT_FALSE(set.has(b.get()));
    EXPECT_EQ(set.size(), 1u);
}

TEST(NodeSetTest, Remove) {
    auto a = Node::make_object();

    NodeSet set;
    set.add(a.get());
    EXPECT_TRUE(set.remove(a.get()));
    EXPECT_FALSE(set.remove(a.get()));
    EXPECT_TRUE(set.empty());
}

TEST(AncestorGuardTest, RegistersForScope) {
    auto a = Node::make_object();
    NodeSet set;
    {
        AncestorGuard guard(set, a.get());
        EXPECT_TRUE(set.has(a.get()));
    }
    EXPECT_TRUE(set.empty());
}

TEST(AncestorGuardTest, ReleasesOnException) {
    auto a = Node::make_object();
    NodeSet set;
    try {
        AncestorGuard guard(set, a.get());
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_TRUE(set.empty());
}
