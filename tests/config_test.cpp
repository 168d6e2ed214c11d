#include <gtest/gtest.h>
#include "../include/config.hpp"
#include "test_util.hpp"

using namespace pixserv;

TEST(Config, DefaultsWithoutAnySource) {
    Config config;
    ServerSettings settings = config.toSettings();

    EXPECT_EQ(settings.port, 3001);
    EXPECT_EQ(settings.storagePath, "./public");
    EXPECT_TRUE(settings.requireAuth);
    EXPECT_EQ(settings.authKey, "changeme123");
    EXPECT_FALSE(settings.readOnly);
    EXPECT_EQ(settings.workerThreads, 4u);
    EXPECT_EQ(settings.idleTimeoutSeconds, 30);
}

TEST(Config, ReadsNestedKeys) {
    Config config;
    ASSERT_TRUE(config.loadFromString(R"({
        "server": {"port": 9000, "storage_path": "/srv/img", "worker_threads": 8, "read_only": true},
        "auth": {"require_auth": false, "key": "k"},
        "logging": {"level": "debug"}
    })"));

    EXPECT_EQ(config.getInt("server.port"), 9000);
    ServerSettings settings = config.toSettings();
    EXPECT_EQ(settings.port, 9000);
    EXPECT_EQ(settings.storagePath, "/srv/img");
    EXPECT_EQ(settings.workerThreads, 8u);
    EXPECT_TRUE(settings.readOnly);
    EXPECT_FALSE(settings.requireAuth);
    EXPECT_EQ(settings.authKey, "k");
    EXPECT_EQ(settings.logLevel, "debug");
}

TEST(Config, WrongTypesFallBackToDefaults) {
    Config config;
    ASSERT_TRUE(config.loadFromString(R"({"server": {"port": "eighty"}, "auth": {"require_auth": "no"}})"));
    EXPECT_EQ(config.getInt("server.port", 7), 7);
    EXPECT_TRUE(config.getBool("auth.require_auth", true));
    EXPECT_EQ(config.getString("missing.key", "fallback"), "fallback");
}

TEST(Config, EnvironmentOverridesFile) {
    Config config;
    ASSERT_TRUE(config.loadFromString(R"({"server": {"port": 9000}, "auth": {"key": "file"}})"));
    config.applyEnvironment({
        {"PORT", "8080"},
        {"SERVE_DIR", "/data"},
        {"AUTH_KEY", "env"},
        {"REQUIRE_AUTH", "false"},
        {"READ_ONLY", "1"},
    });

    ServerSettings settings = config.toSettings();
    EXPECT_EQ(settings.port, 8080);
    EXPECT_EQ(settings.storagePath, "/data");
    EXPECT_EQ(settings.authKey, "env");
    EXPECT_FALSE(settings.requireAuth);
    EXPECT_TRUE(settings.readOnly);
}

TEST(Config, OnlyLiteralFalseDisablesAuth) {
    Config config;
    config.applyEnvironment({{"REQUIRE_AUTH", "no"}});
    EXPECT_TRUE(config.toSettings().requireAuth);

    config.applyEnvironment({{"REQUIRE_AUTH", "FALSE"}});
    EXPECT_TRUE(config.toSettings().requireAuth);
}

TEST(Config, InvalidPortIsIgnored) {
    Config config;
    config.applyEnvironment({{"PORT", "not-a-number"}});
    EXPECT_EQ(config.toSettings().port, 3001);

    config.applyEnvironment({{"PORT", "70000"}});
    EXPECT_EQ(config.toSettings().port, 3001);
}

TEST(Config, IdleTimeoutMustBePositive) {
    Config config;
    ASSERT_TRUE(config.loadFromString(R"({"server": {"idle_timeout_seconds": 5}})"));
    EXPECT_EQ(config.toSettings().idleTimeoutSeconds, 5);

    ASSERT_TRUE(config.loadFromString(R"({"server": {"idle_timeout_seconds": 0}})"));
    EXPECT_EQ(config.toSettings().idleTimeoutSeconds, 30);
}

TEST(Config, RejectsMalformedOrNonObjectDocuments) {
    Config config;
    EXPECT_FALSE(config.loadFromString("{not json"));
    EXPECT_FALSE(config.loadFromString("[1, 2, 3]"));
}

TEST(Config, LoadsFromFile) {
    pixserv::test::TempDir dir;
    auto path = dir.path() / "config.json";
    pixserv::test::writeFile(path, R"({"server": {"port": 4242}})");

    Config config;
    ASSERT_TRUE(config.loadFromFile(path.string()));
    EXPECT_EQ(config.toSettings().port, 4242);

    EXPECT_FALSE(config.loadFromFile((dir.path() / "missing.json").string()));
}
