/**
 * @file test_connectionregistry.cpp
 * @brief Unit tests for ConnectionRegistry client reuse
 */

#include <gtest/gtest.h>
#include "connectionregistry.hpp"
#include "testsupport.hpp"

namespace {

Connection connection(const std::string& id, const std::string& url) {
    Connection c;
    c.id = id;
    c.name = id;
    c.url = url;
    return c;
}

} // namespace

/**
 * @test KeepsClientsOfUnchangedConnections
 * @brief Only new or re-targeted connections get a new client
 */
TEST(ConnectionRegistryTest, KeepsClientsOfUnchangedConnections) {
    int created = 0;
    ConnectionRegistry registry([&](const Connection&) {
        ++created;
        return std::make_shared<FakeResourceClient>();
    });

    registry.setConnections({connection("a", "http://a"), connection("b", "http://b")});
    EXPECT_EQ(created, 2);
    auto a = registry.client("a");
    auto b = registry.client("b");

    registry.setConnections({connection("a", "http://a"), connection("b", "http://b2")});
    EXPECT_EQ(created, 3);
    EXPECT_EQ(registry.client("a"), a);
    EXPECT_NE(registry.client("b"), b);
}

/**
 * @test RemovedConnectionsHaveNoClient
 * @brief Handed-out clients stay valid after removal
 */
TEST(ConnectionRegistryTest, RemovedConnectionsHaveNoClient) {
    ConnectionRegistry registry([](const Connection&) {
        return std::make_shared<FakeResourceClient>();
    });
    registry.setConnections({connection("a", "http://a")});
    auto held = registry.client("a");

    registry.setConnections({});

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.client("a"), nullptr);
    EXPECT_EQ(registry.find("a"), nullptr);
    ASSERT_NE(held, nullptr);
    EXPECT_TRUE(held->listWorkspaces().ok());
}
