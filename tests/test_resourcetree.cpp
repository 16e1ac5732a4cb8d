/**
 * @file test_resourcetree.cpp
 * @brief Unit tests for the lazily loaded resource tree
 *
 * Tests cover:
 * - One fetch per node, no matter how often it is expanded
 * - Locally created workspace categories
 * - Failed and stale listings
 * - Snapshot and restore after a rebuild
 *
 * @see ResourceTree
 */

#include <gtest/gtest.h>
#include "resourcetree.hpp"
#include "testsupport.hpp"

/**
 * @class ResourceTreeTest
 * @brief Fixture with one connection ("local") served by a fake client
 *
 * The fake serves two workspaces; topp holds two data stores.
 */
class ResourceTreeTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeResourceClient> client = std::make_shared<FakeResourceClient>();
    ConnectionRegistry registry{[this](const Connection&) -> std::shared_ptr<IResourceClient> {
        return client;
    }};
    ResourceTree tree;
    TestEffectContext context;

    void SetUp() override {
        Connection local;
        local.id = "c1";
        local.name = "local";
        local.url = "http://localhost:8080/geoserver";
        registry.setConnections({local});
        tree.rebuild(registry.connections());

        client->listings["workspaces"] = items({"topp", "sf"});
        client->listings["datastores:topp"] = items({"roads", "rivers"});
    }

    /** @brief Runs every effect right away and applies the listings */
    void apply(std::vector<Effect> effects) {
        for (const auto& effect : effects) {
            Message message = runEffect(effect, context);
            ASSERT_TRUE(std::holds_alternative<ChildrenLoaded>(message));
            apply(tree.onChildrenLoaded(std::get<ChildrenLoaded>(message), registry));
        }
    }

    Node& node(const TreePath& path) {
        Node* found = tree.findPath(path);
        EXPECT_NE(found, nullptr);
        return *found;
    }

    /** @brief Expands down to local/topp/Data Stores */
    void loadDataStores() {
        apply(tree.expand(node({"local"}), registry));
        apply(tree.expand(node({"local", "topp"}), registry));
        apply(tree.expand(node({"local", "topp", "Data Stores"}), registry));
    }

    std::vector<Effect> update(const Message& message) {
        if (const auto* loaded = std::get_if<ChildrenLoaded>(&message)) {
            return tree.onChildrenLoaded(*loaded, registry);
        }
        return {};
    }
};

/**
 * @test RebuildCreatesConnectionNodes
 */
TEST_F(ResourceTreeTest, RebuildCreatesConnectionNodes) {
    EXPECT_EQ(tree.root().name, "Servers");
    EXPECT_TRUE(tree.root().path().empty());
    ASSERT_EQ(tree.root().children.size(), 1u);

    const Node& conn = *tree.root().children[0];
    EXPECT_EQ(conn.kind, NodeKind::Connection);
    EXPECT_EQ(conn.connectionId, "c1");
    EXPECT_EQ(conn.path(), TreePath{"local"});
    EXPECT_FALSE(conn.loaded);
    EXPECT_EQ(tree.cursor(), &tree.root());
}

/**
 * @test ExpandFetchesOnce
 * @brief A loading or loaded node never triggers a second listing
 */
TEST_F(ResourceTreeTest, ExpandFetchesOnce) {
    Node& conn = node({"local"});

    auto first = tree.expand(conn, registry);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].kind, EffectKind::Fetch);
    EXPECT_EQ(first[0].label, "list local");
    EXPECT_TRUE(conn.loading);

    EXPECT_TRUE(tree.expand(conn, registry).empty());
    tree.collapse(conn);
    EXPECT_TRUE(tree.expand(conn, registry).empty());

    apply(std::move(first));
    EXPECT_TRUE(conn.loaded);
    EXPECT_FALSE(conn.loading);
    EXPECT_TRUE(tree.expand(conn, registry).empty());
    EXPECT_EQ(client->countCalls("list workspaces"), 1u);

    ASSERT_EQ(conn.children.size(), 2u);
    EXPECT_EQ(conn.children[0]->name, "topp");
    EXPECT_EQ(conn.children[0]->kind, NodeKind::Workspace);
    EXPECT_EQ(conn.children[0]->workspace, "topp");
}

/**
 * @test WorkspaceCategoriesAreLocal
 * @brief Expanding a workspace creates its categories without a request
 */
TEST_F(ResourceTreeTest, WorkspaceCategoriesAreLocal) {
    apply(tree.expand(node({"local"}), registry));
    const size_t calls = client->calls.size();

    Node& ws = node({"local", "topp"});
    EXPECT_TRUE(tree.expand(ws, registry).empty());

    EXPECT_EQ(client->calls.size(), calls);
    EXPECT_TRUE(ws.loaded);
    ASSERT_EQ(ws.children.size(), 5u);
    EXPECT_EQ(ws.children[0]->name, "Data Stores");
    EXPECT_EQ(ws.children[1]->name, "Coverage Stores");
    EXPECT_EQ(ws.children[2]->name, "Styles");
    EXPECT_EQ(ws.children[3]->name, "Layers");
    EXPECT_EQ(ws.children[4]->name, "Layer Groups");
    EXPECT_EQ(ws.children[3]->category, Category::Layers);
}

/**
 * @test CategoryListsResources
 */
TEST_F(ResourceTreeTest, CategoryListsResources) {
    loadDataStores();

    const Node& stores = node({"local", "topp", "Data Stores"});
    ASSERT_EQ(stores.children.size(), 2u);
    EXPECT_EQ(stores.children[0]->kind, NodeKind::Resource);
    EXPECT_EQ(stores.children[0]->category, Category::DataStores);
    EXPECT_EQ(stores.children[0]->workspace, "topp");
    EXPECT_EQ(stores.children[1]->path(),
              (TreePath{"local", "topp", "Data Stores", "rivers"}));
    EXPECT_EQ(nodeKindLabel(*stores.children[0]), "data store");
    EXPECT_EQ(client->countCalls("list datastores:topp"), 1u);
}

/**
 * @test FailedListingCanBeRetried
 * @brief An error is kept on the node, which stays unloaded
 */
TEST_F(ResourceTreeTest, FailedListingCanBeRetried) {
    client->failingListings.insert("workspaces");
    Node& conn = node({"local"});

    apply(tree.expand(conn, registry));

    EXPECT_FALSE(conn.loaded);
    EXPECT_FALSE(conn.loading);
    ASSERT_TRUE(conn.error.has_value());
    EXPECT_EQ(*conn.error, "HTTP 500 listing workspaces");

    client->failingListings.clear();
    apply(tree.expand(conn, registry));

    EXPECT_TRUE(conn.loaded);
    EXPECT_FALSE(conn.error.has_value());
    EXPECT_EQ(conn.children.size(), 2u);
}

/**
 * @test ListingForDiscardedNodeIsIgnored
 */
TEST_F(ResourceTreeTest, ListingForDiscardedNodeIsIgnored) {
    auto effects = tree.expand(node({"local"}), registry);
    ASSERT_EQ(effects.size(), 1u);

    tree.rebuild(registry.connections());
    Message late = runEffect(effects[0], context);
    auto follow_up = tree.onChildrenLoaded(std::get<ChildrenLoaded>(late), registry);

    EXPECT_TRUE(follow_up.empty());
    EXPECT_TRUE(node({"local"}).children.empty());
    EXPECT_FALSE(node({"local"}).loaded);
}

/**
 * @test MissingConnectionSetsError
 */
TEST_F(ResourceTreeTest, MissingConnectionSetsError) {
    registry.setConnections({});
    Node& conn = node({"local"});

    EXPECT_TRUE(tree.expand(conn, registry).empty());
    ASSERT_TRUE(conn.error.has_value());
    EXPECT_EQ(*conn.error, "connection is no longer configured");
}

/**
 * @test CursorMovesOverVisibleRows
 */
TEST_F(ResourceTreeTest, CursorMovesOverVisibleRows) {
    apply(tree.expand(node({"local"}), registry));
    // Servers, local, topp, sf
    EXPECT_EQ(tree.visibleRows().size(), 4u);

    tree.moveCursor(2);
    EXPECT_EQ(tree.cursor()->name, "topp");
    tree.moveCursor(10);
    EXPECT_EQ(tree.cursor()->name, "sf");
    tree.moveCursorToEdge(false);
    EXPECT_EQ(tree.cursor(), &tree.root());

    tree.collapse(node({"local"}));
    EXPECT_EQ(tree.visibleRows().size(), 2u);
}

/**
 * @test SnapshotRestoresCursorAndExpansion
 * @brief After a rebuild the same nodes are reloaded and the cursor found again
 */
TEST_F(ResourceTreeTest, SnapshotRestoresCursorAndExpansion) {
    loadDataStores();
    tree.setCursor(node({"local", "topp", "Data Stores", "rivers"}));
    TreeSnapshot snap = tree.snapshot();
    EXPECT_EQ(snap.expanded.count(TreePath{"local", "topp"}), 1u);

    tree.rebuild(registry.connections());
    EXPECT_EQ(tree.cursor(), &tree.root());

    EffectDriver driver;
    driver.push(tree.restore(snap, registry));
    EXPECT_TRUE(tree.restoring());
    driver.run([this](const Message& m) { return update(m); });

    EXPECT_FALSE(tree.restoring());
    EXPECT_EQ(tree.cursor()->path(), (TreePath{"local", "topp", "Data Stores", "rivers"}));
    EXPECT_TRUE(node({"local", "topp"}).expanded);
    EXPECT_FALSE(node({"local", "sf"}).expanded);
    EXPECT_EQ(driver.count(EffectKind::Fetch), 2u);
}

/**
 * @test RestoreFallsBackToRoot
 * @brief A cursor whose node disappeared lands on the root
 */
TEST_F(ResourceTreeTest, RestoreFallsBackToRoot) {
    loadDataStores();
    tree.setCursor(node({"local", "topp", "Data Stores", "roads"}));
    TreeSnapshot snap = tree.snapshot();

    client->listings["datastores:topp"] = items({"rivers"});
    tree.rebuild(registry.connections());

    EffectDriver driver;
    driver.push(tree.restore(snap, registry));
    driver.run([this](const Message& m) { return update(m); });

    EXPECT_FALSE(tree.restoring());
    EXPECT_EQ(tree.cursor(), &tree.root());
    EXPECT_TRUE(node({"local", "topp", "Data Stores"}).expanded);
}

/**
 * @test CursorMoveDuringRestoreWins
 * @brief Restore never moves a cursor the operator has already moved
 */
TEST_F(ResourceTreeTest, CursorMoveDuringRestoreWins) {
    loadDataStores();
    tree.setCursor(node({"local", "topp", "Data Stores", "roads"}));
    TreeSnapshot snap = tree.snapshot();
    tree.rebuild(registry.connections());

    EffectDriver driver;
    driver.push(tree.restore(snap, registry));
    tree.setCursor(node({"local"}));
    driver.run([this](const Message& m) { return update(m); });

    EXPECT_EQ(tree.cursor()->path(), TreePath{"local"});
}

/**
 * @test LoadedNodesInDisplayOrder
 */
TEST_F(ResourceTreeTest, LoadedNodesInDisplayOrder) {
    apply(tree.expand(node({"local"}), registry));

    auto nodes = tree.loadedNodes();

    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0]->name, "local");
    EXPECT_EQ(nodes[1]->name, "topp");
    EXPECT_EQ(nodes[2]->name, "sf");
}
