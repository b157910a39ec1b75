// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// JSON configuration loading

#include <catch2/catch_test_macros.hpp>
#include "application.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace chaincraft;
using namespace chaincraft::app;
using json = nlohmann::json;

class ConfigTestFixture {
public:
    std::string test_dir;

    ConfigTestFixture() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = "/tmp/chaincraft_config_test_" + std::to_string(now);
        std::filesystem::create_directory(test_dir);
    }

    ~ConfigTestFixture() {
        std::filesystem::remove_all(test_dir);
    }

    std::string WriteFile(const std::string& name, const std::string& contents) {
        std::string path = test_dir + "/" + name;
        std::ofstream out(path);
        out << contents;
        return path;
    }
};

TEST_CASE("Config - Defaults", "[config][unit]") {
    AppConfig config;
    const auto& n = config.node_config;
    CHECK(n.network_magic == protocol::magic::MAINNET);
    CHECK(n.port == protocol::DEFAULT_PORT);
    CHECK(n.max_peers == protocol::DEFAULT_MAX_PEERS);
    CHECK(n.min_peers == protocol::DEFAULT_MIN_PEERS);
    CHECK(n.validator == "append-only");
    CHECK(n.bootstrap_addresses.empty());
    CHECK(config.log_level == "info");
    CHECK_FALSE(config.datadir.empty());
}

TEST_CASE("Config - Applying JSON", "[config][unit]") {
    AppConfig config;
    std::string error;

    SECTION("Known keys") {
        json j = {
            {"network", "regtest"},
            {"port", 9100},
            {"listen_enabled", false},
            {"max_peers", 8},
            {"min_peers", 2},
            {"bootstrap_addresses", {"node-a:9000", "[::1]:9001"}},
            {"dedup_capacity", 500},
            {"dedup_ttl", 30},
            {"peer_timeout", 90},
            {"backoff_base", 2},
            {"ban_threshold", 4},
            {"ban_duration", 600},
            {"send_queue_limit", 16},
            {"deferred_ttl", 45},
            {"validator", "dependency"},
            {"log_level", "debug"},
            {"datadir", "/tmp/somewhere"},
        };
        REQUIRE(ApplyConfigJson(j, config, error));

        const auto& n = config.node_config;
        CHECK(n.network_magic == protocol::magic::REGTEST);
        CHECK(n.port == 9100);
        CHECK_FALSE(n.listen_enabled);
        CHECK(n.max_peers == 8);
        CHECK(n.min_peers == 2);
        REQUIRE(n.bootstrap_addresses.size() == 2);
        CHECK(n.bootstrap_addresses[0] == protocol::NetworkAddress("node-a", 9000));
        CHECK(n.bootstrap_addresses[1] == protocol::NetworkAddress("::1", 9001));
        CHECK(n.dedup_capacity == 500);
        CHECK(n.dedup_ttl == std::chrono::seconds(30));
        CHECK(n.peer_timeout == std::chrono::seconds(90));
        CHECK(n.backoff_base == std::chrono::seconds(2));
        CHECK(n.ban_threshold == 4);
        CHECK(n.ban_duration == 600);
        CHECK(n.send_queue_limit == 16);
        CHECK(n.deferred_ttl == std::chrono::seconds(45));
        CHECK(n.validator == "dependency");
        CHECK(config.log_level == "debug");
        CHECK(config.datadir == std::filesystem::path("/tmp/somewhere"));
    }

    SECTION("Untouched fields keep their defaults") {
        REQUIRE(ApplyConfigJson(json{{"port", 9200}}, config, error));
        CHECK(config.node_config.max_peers == protocol::DEFAULT_MAX_PEERS);
        CHECK(config.node_config.validator == "append-only");
    }

    SECTION("Unknown key") {
        CHECK_FALSE(ApplyConfigJson(json{{"max_connections", 10}}, config, error));
        CHECK(error.find("max_connections") != std::string::npos);
    }

    SECTION("Unknown network name") {
        CHECK_FALSE(ApplyConfigJson(json{{"network", "moon"}}, config, error));
    }

    SECTION("Type mismatch") {
        CHECK_FALSE(ApplyConfigJson(json{{"port", "ninety"}}, config, error));
        CHECK_FALSE(error.empty());
    }

    SECTION("Malformed bootstrap address") {
        CHECK_FALSE(ApplyConfigJson(json{{"bootstrap_addresses", {"nohost"}}},
                                    config, error));
    }

    SECTION("min_peers above max_peers") {
        CHECK_FALSE(ApplyConfigJson(json{{"max_peers", 2}, {"min_peers", 3}},
                                    config, error));
    }

    SECTION("Root must be an object") {
        CHECK_FALSE(ApplyConfigJson(json::array({1, 2}), config, error));
    }
}

TEST_CASE("Config - Loading a file", "[config][unit]") {
    ConfigTestFixture fixture;
    AppConfig config;
    std::string error;

    SECTION("Valid file") {
        auto path = fixture.WriteFile("node.json",
                                      R"({"network": "testnet", "max_peers": 12})");
        REQUIRE(LoadConfigFile(path, config, error));
        CHECK(config.node_config.network_magic == protocol::magic::TESTNET);
        CHECK(config.node_config.max_peers == 12);
    }

    SECTION("Missing file") {
        CHECK_FALSE(LoadConfigFile(fixture.test_dir + "/absent.json", config, error));
        CHECK(error.find("cannot read") != std::string::npos);
    }

    SECTION("Invalid JSON") {
        auto path = fixture.WriteFile("broken.json", "{ port: ");
        CHECK_FALSE(LoadConfigFile(path, config, error));
    }
}
