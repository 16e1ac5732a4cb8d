/**
 * @file test_configstore.cpp
 * @brief Unit tests for AppConfig and ConfigStore persistence
 *
 * @see ConfigStore
 */

#include <gtest/gtest.h>
#include "configstore.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

/**
 * @class ConfigStoreTest
 * @brief Fixture providing a private directory for config files
 */
class ConfigStoreTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;

    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
                   (std::string("configstore_test_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }
};

/**
 * @test MissingFileGivesDefaults
 * @brief A first start works without a configuration file
 */
TEST_F(ConfigStoreTest, MissingFileGivesDefaults) {
    ConfigStore store(test_dir / "config.json");

    auto loaded = store.load();

    ASSERT_TRUE(loaded.ok()) << loaded.error();
    EXPECT_TRUE(loaded.value().connections.empty());
    EXPECT_EQ(loaded.value().pingInterval(), AppConfig::DEFAULT_PING_INTERVAL);
    EXPECT_FALSE(loaded.value().lastLocalPath.empty());
}

/**
 * @test SaveThenLoad
 * @brief Connections and settings survive a save/load cycle
 */
TEST_F(ConfigStoreTest, SaveThenLoad) {
    ConfigStore store(test_dir / "nested" / "config.json");

    AppConfig config;
    Connection conn;
    conn.name = "local";
    conn.url = "http://localhost:8080/geoserver";
    conn.username = "admin";
    conn.password = "geoserver";
    const std::string id = config.addConnection(conn);
    config.activeConnection = id;
    config.lastLocalPath = "/data";
    config.setPingInterval(30);

    ASSERT_TRUE(store.save(config).ok());
    EXPECT_FALSE(std::filesystem::exists(test_dir / "nested" / "config.json.tmp"));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    const AppConfig& back = loaded.value();
    ASSERT_EQ(back.connections.size(), 1u);
    EXPECT_EQ(back.connections[0].id, id);
    EXPECT_EQ(back.connections[0].password, "geoserver");
    EXPECT_EQ(back.activeConnection, id);
    EXPECT_EQ(back.lastLocalPath, "/data");
    EXPECT_EQ(back.pingInterval(), 30);
}

/**
 * @test SavedFileIsPrivate
 * @brief The file holds credentials and is readable by the owner only
 */
TEST_F(ConfigStoreTest, SavedFileIsPrivate) {
    ConfigStore store(test_dir / "config.json");
    ASSERT_TRUE(store.save(AppConfig{}).ok());

    auto perms = std::filesystem::status(test_dir / "config.json").permissions();
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);
}

/**
 * @test LeftoverTempFileIsRestricted
 * @brief A world-readable temp file from an earlier crash is reused privately
 */
TEST_F(ConfigStoreTest, LeftoverTempFileIsRestricted) {
    namespace fs = std::filesystem;
    const fs::path tmp = test_dir / "config.json.tmp";
    {
        std::ofstream out(tmp);
        out << std::string(4096, 'x');
    }
    fs::permissions(tmp, fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);

    ConfigStore store(test_dir / "config.json");
    AppConfig config;
    config.theme = "light";
    ASSERT_TRUE(store.save(config).ok());

    EXPECT_FALSE(fs::exists(tmp));
    auto perms = fs::status(test_dir / "config.json").permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    EXPECT_EQ(loaded.value().theme, "light");
}

/**
 * @test ConcurrentSavesKeepFileReadable
 * @brief Two writers sharing one store never interleave on the temp file
 */
TEST_F(ConfigStoreTest, ConcurrentSavesKeepFileReadable) {
    ConfigStore store(test_dir / "config.json");
    AppConfig one;
    one.connections.resize(1);
    AppConfig two;
    two.connections.resize(2);

    std::atomic<int> failures{0};
    auto writer = [&](const AppConfig& config) {
        for (int i = 0; i < 50; ++i) {
            if (!store.save(config).ok()) {
                ++failures;
            }
        }
    };
    std::thread first(writer, std::cref(one));
    std::thread second(writer, std::cref(two));
    first.join();
    second.join();

    EXPECT_EQ(failures.load(), 0);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    const size_t count = loaded.value().connections.size();
    EXPECT_TRUE(count == 1u || count == 2u);
}

/**
 * @test CorruptFileIsAnError
 */
TEST_F(ConfigStoreTest, CorruptFileIsAnError) {
    {
        std::ofstream out(test_dir / "config.json");
        out << "{ not json";
    }
    ConfigStore store(test_dir / "config.json");

    auto loaded = store.load();

    EXPECT_FALSE(loaded.ok());
    EXPECT_NE(loaded.error().find("parse"), std::string::npos);
}

/**
 * @test PingIntervalIsClamped
 */
TEST(AppConfigTest, PingIntervalIsClamped) {
    AppConfig config;
    config.setPingInterval(1);
    EXPECT_EQ(config.pingInterval(), AppConfig::MIN_PING_INTERVAL);
    config.setPingInterval(100000);
    EXPECT_EQ(config.pingInterval(), AppConfig::MAX_PING_INTERVAL);
}

/**
 * @test ConnectionEditing
 * @brief Add assigns ids, update replaces, remove clears the active id
 */
TEST(AppConfigTest, ConnectionEditing) {
    AppConfig config;
    Connection a;
    a.name = "a";
    const std::string id = config.addConnection(a);
    EXPECT_EQ(id.rfind("conn-", 0), 0u);
    config.activeConnection = id;

    Connection changed = *config.findConnection(id);
    changed.url = "https://example.org/geoserver";
    EXPECT_TRUE(config.updateConnection(changed));
    EXPECT_EQ(config.findConnection(id)->url, "https://example.org/geoserver");

    EXPECT_TRUE(config.removeConnection(id));
    EXPECT_FALSE(config.removeConnection(id));
    EXPECT_EQ(config.findConnection(id), nullptr);
    EXPECT_TRUE(config.activeConnection.empty());
}
