#include <gtest/gtest.h>
#include "relaylb/config_loader.hpp"
#include <cstdio>
#include <fstream>

using namespace relaylb;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_path = "relaylb_test_config.json";
    }

    void TearDown() override {
        std::remove(test_config_path.c_str());
    }

    void write_config(const std::string& content) {
        std::ofstream file(test_config_path);
        file << content;
        file.close();
    }

    std::string test_config_path;
};

TEST_F(ConfigLoaderTest, LoadValidConfig) {
    std::string valid_config = R"({
        "load_balancer": {
            "port": 8000,
            "log_file": "test.log",
            "log_level": "DEBUG",
            "algorithm": "least-connections",
            "sticky": true,
            "sticky_ttl_seconds": 120
        },
        "backends": [
            {"id": "signal-1", "host": "10.0.0.5", "port": 52178, "weight": 2},
            {"id": "signal-2", "host": "10.0.0.6", "port": 52179}
        ],
        "health_check": {
            "interval_seconds": 10,
            "timeout_seconds": 2,
            "path": "/healthz"
        },
        "admin": {
            "enabled": false,
            "port": 9191
        },
        "signaling": {
            "max_message_size": 1024,
            "heartbeat_interval_seconds": 15,
            "trusted_proxies": ["10.0.0.1"]
        }
    })";

    write_config(valid_config);

    auto result = ConfigLoader::load(test_config_path);
    ASSERT_TRUE(result.has_value()) << result.error();

    Config config = result.value();
    EXPECT_EQ(config.load_balancer.port, 8000);
    EXPECT_EQ(config.load_balancer.log_file, "test.log");
    EXPECT_EQ(config.load_balancer.log_level, "DEBUG");
    EXPECT_EQ(config.load_balancer.algorithm, "least-connections");
    EXPECT_TRUE(config.load_balancer.sticky);
    EXPECT_EQ(config.load_balancer.sticky_ttl_seconds, 120);

    ASSERT_EQ(config.backends.size(), 2);
    EXPECT_EQ(config.backends[0].id, "signal-1");
    EXPECT_EQ(config.backends[0].host, "10.0.0.5");
    EXPECT_EQ(config.backends[0].weight, 2);
    EXPECT_EQ(config.backends[1].port, 52179);
    EXPECT_EQ(config.backends[1].weight, 1);

    EXPECT_EQ(config.health_check.interval_seconds, 10);
    EXPECT_EQ(config.health_check.timeout_seconds, 2);
    EXPECT_EQ(config.health_check.path, "/healthz");

    EXPECT_FALSE(config.admin.enabled);
    EXPECT_EQ(config.admin.port, 9191);
    EXPECT_EQ(config.admin.host, "127.0.0.1");

    EXPECT_EQ(config.signaling.max_message_size, 1024);
    EXPECT_EQ(config.signaling.heartbeat_interval_seconds, 15);
    EXPECT_EQ(config.signaling.trusted_proxies, std::vector<std::string>{"10.0.0.1"});
}

TEST_F(ConfigLoaderTest, DefaultsFillOmittedFields) {
    auto result = ConfigLoader::parse_config(R"({
        "load_balancer": {},
        "backends": [{"host": "localhost", "port": 3000}]
    })");
    ASSERT_TRUE(result.has_value()) << result.error();

    const auto& config = result.value();
    EXPECT_EQ(config.load_balancer.port, 8080);
    EXPECT_EQ(config.load_balancer.algorithm, "round-robin");
    EXPECT_FALSE(config.load_balancer.sticky);
    EXPECT_EQ(config.health_check.interval_seconds, 30);
    EXPECT_EQ(config.health_check.timeout_seconds, 5);
    EXPECT_EQ(config.health_check.path, "/health");
    EXPECT_TRUE(config.admin.enabled);
    EXPECT_EQ(config.admin.port, 9090);
    EXPECT_EQ(config.signaling.max_message_size, 65536);
    EXPECT_EQ(config.signaling.heartbeat_interval_seconds, 30);
    EXPECT_EQ(config.signaling.trusted_proxies, (std::vector<std::string>{"127.0.0.1", "::1"}));

    // Id derived from the address when omitted
    EXPECT_EQ(config.backends[0].id, "localhost:3000");
}

TEST_F(ConfigLoaderTest, MissingFile) {
    auto result = ConfigLoader::load("nonexistent.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Failed to open config file"), std::string::npos);
}

TEST_F(ConfigLoaderTest, InvalidJson) {
    write_config("{ invalid json }");
    auto result = ConfigLoader::load(test_config_path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("JSON parsing error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, MissingLoadBalancerSection) {
    auto result = ConfigLoader::parse_config(R"({"backends": [{"port": 3000}]})");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, MissingBackends) {
    std::string invalid_config = R"({
        "load_balancer": {
            "port": 8000,
            "log_file": "test.log",
            "log_level": "INFO"
        },
        "health_check": {
            "interval_seconds": 1,
            "timeout_seconds": 1
        }
    })";

    write_config(invalid_config);
    auto result = ConfigLoader::load(test_config_path);
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, EmptyBackends) {
    std::string invalid_config = R"({
        "load_balancer": {
            "port": 8000
        },
        "backends": []
    })";

    write_config(invalid_config);
    auto result = ConfigLoader::load(test_config_path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Configuration validation failed"), std::string::npos);
}

TEST_F(ConfigLoaderTest, DuplicateBackendIds) {
    auto result = ConfigLoader::parse_config(R"({
        "load_balancer": {},
        "backends": [
            {"id": "a", "port": 3000},
            {"id": "a", "port": 3001}
        ]
    })");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("duplicate backend id"), std::string::npos);
}

TEST_F(ConfigLoaderTest, NonPositiveWeight) {
    auto result = ConfigLoader::parse_config(R"({
        "load_balancer": {},
        "backends": [{"id": "a", "port": 3000, "weight": 0}]
    })");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, UnknownAlgorithm) {
    auto result = ConfigLoader::parse_config(R"({
        "load_balancer": {"algorithm": "fastest"},
        "backends": [{"port": 3000}]
    })");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("unknown algorithm"), std::string::npos);
}

TEST_F(ConfigLoaderTest, InvalidHealthInterval) {
    auto result = ConfigLoader::parse_config(R"({
        "load_balancer": {},
        "backends": [{"port": 3000}],
        "health_check": {"interval_seconds": 0}
    })");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, WrongFieldTypeIsParseError) {
    auto result = ConfigLoader::parse_config(R"({
        "load_balancer": {"port": "eighty"},
        "backends": [{"port": 3000}]
    })");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("JSON parsing error"), std::string::npos);
}
