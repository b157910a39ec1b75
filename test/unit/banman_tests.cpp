// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Unit tests for BanMan: persistence, expiry and discouragement

#include <catch2/catch_test_macros.hpp>
#include "network/banman.hpp"
#include "util/time.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace chaincraft;
using namespace chaincraft::network;
using json = nlohmann::json;

class BanTestFixture {
public:
    std::string test_dir;

    BanTestFixture() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = "/tmp/chaincraft_ban_test_" + std::to_string(now);
        std::filesystem::create_directory(test_dir);
    }

    ~BanTestFixture() {
        std::filesystem::remove_all(test_dir);
    }

    std::string GetBanlistPath() const {
        return test_dir + "/banlist.json";
    }
};

TEST_CASE("BanMan - Basic ban operations", "[network][ban][unit]") {
    BanMan bm;

    SECTION("Ban and check") {
        REQUIRE_FALSE(bm.IsBanned("10.0.0.1:9000"));
        bm.Ban("10.0.0.1:9000", 3600, "test");
        CHECK(bm.IsBanned("10.0.0.1:9000"));
        CHECK_FALSE(bm.IsBanned("10.0.0.2:9000"));

        auto banned = bm.GetBanned();
        REQUIRE(banned.count("10.0.0.1:9000") == 1);
        CHECK(banned["10.0.0.1:9000"].reason == "test");
    }

    SECTION("Unban") {
        bm.Ban("10.0.0.1:9000");
        bm.Unban("10.0.0.1:9000");
        CHECK_FALSE(bm.IsBanned("10.0.0.1:9000"));
        // Unknown address is a no-op
        bm.Unban("10.0.0.9:9000");
    }

    SECTION("Clear") {
        bm.Ban("a:1");
        bm.Ban("b:1");
        bm.ClearBanned();
        CHECK(bm.GetBanned().empty());
    }

    SECTION("No datadir means no file") {
        CHECK(bm.GetBanlistPath().empty());
        CHECK(bm.Save());
        CHECK(bm.Load());
    }
}

TEST_CASE("BanMan - Expiration", "[network][ban][unit]") {
    util::MockTimeScope mock_time(100000);
    BanMan bm;

    bm.Ban("timed:1", 60);
    bm.Ban("forever:1", 0);

    util::SetMockTime(100059);
    CHECK(bm.IsBanned("timed:1"));

    util::SetMockTime(100060);
    CHECK_FALSE(bm.IsBanned("timed:1"));
    CHECK(bm.IsBanned("forever:1"));

    // Expired entries linger until swept
    CHECK(bm.GetBanned().size() == 2);
    bm.SweepBanned();
    auto banned = bm.GetBanned();
    CHECK(banned.size() == 1);
    CHECK(banned.count("forever:1") == 1);
}

TEST_CASE("BanMan - Persistence", "[network][ban][unit]") {
    BanTestFixture fixture;

    SECTION("Bans survive a reload") {
        {
            BanMan bm(fixture.test_dir);
            bm.Ban("10.0.0.1:9000", 0, "operator");
            bm.Ban("10.0.0.2:9000", 3600);
        }
        REQUIRE(std::filesystem::exists(fixture.GetBanlistPath()));

        BanMan reloaded(fixture.test_dir);
        REQUIRE(reloaded.Load());
        CHECK(reloaded.IsBanned("10.0.0.1:9000"));
        CHECK(reloaded.IsBanned("10.0.0.2:9000"));
        CHECK(reloaded.GetBanned()["10.0.0.1:9000"].reason == "operator");
    }

    SECTION("File format") {
        BanMan bm(fixture.test_dir);
        bm.Ban("10.0.0.1:9000", 0);
        REQUIRE(bm.Save());

        std::ifstream in(fixture.GetBanlistPath());
        json j = json::parse(in);
        CHECK(j["version"] == BanMan::BANLIST_VERSION);
        REQUIRE(j["bans"].contains("10.0.0.1:9000"));
        CHECK(j["bans"]["10.0.0.1:9000"]["ban_until"] == 0);
    }

    SECTION("Expired bans are skipped on load") {
        {
            util::MockTimeScope mock_time(50000);
            BanMan bm(fixture.test_dir);
            bm.Ban("short:1", 10);
            bm.Ban("long:1", 100000);
        }
        util::MockTimeScope later(50011);
        BanMan reloaded(fixture.test_dir);
        REQUIRE(reloaded.Load());
        CHECK_FALSE(reloaded.IsBanned("short:1"));
        CHECK(reloaded.IsBanned("long:1"));
        CHECK(reloaded.GetBanned().size() == 1);
    }

    SECTION("Missing file is a first run") {
        BanMan bm(fixture.test_dir);
        CHECK(bm.Load());
        CHECK(bm.GetBanned().empty());
    }

    SECTION("Corrupt file fails to load") {
        {
            std::ofstream out(fixture.GetBanlistPath());
            out << "{ not json";
        }
        BanMan bm(fixture.test_dir, false);
        CHECK_FALSE(bm.Load());
    }

    SECTION("Wrong version fails to load") {
        {
            std::ofstream out(fixture.GetBanlistPath());
            out << R"({"version": 99, "bans": {}})";
        }
        BanMan bm(fixture.test_dir, false);
        CHECK_FALSE(bm.Load());
    }

    SECTION("Auto-save disabled writes only on Save") {
        BanMan bm(fixture.test_dir, false);
        bm.Ban("10.0.0.1:9000");
        CHECK_FALSE(std::filesystem::exists(fixture.GetBanlistPath()));
        REQUIRE(bm.Save());
        CHECK(std::filesystem::exists(fixture.GetBanlistPath()));
    }
}

TEST_CASE("BanMan - Discouragement", "[network][ban][discourage][unit]") {
    util::MockTimeScope mock_time(200000);
    BanMan bm;

    bm.Discourage("node-a");
    CHECK(bm.IsDiscouraged("node-a"));
    CHECK_FALSE(bm.IsDiscouraged("node-b"));
    // Discouragement is not a ban
    CHECK_FALSE(bm.IsBanned("node-a"));

    SECTION("Lasts one day") {
        util::SetMockTime(200000 + BanMan::DISCOURAGEMENT_DURATION - 1);
        CHECK(bm.IsDiscouraged("node-a"));
        util::SetMockTime(200000 + BanMan::DISCOURAGEMENT_DURATION);
        CHECK_FALSE(bm.IsDiscouraged("node-a"));
        bm.SweepDiscouraged();
        CHECK_FALSE(bm.IsDiscouraged("node-a"));
    }

    SECTION("Clear") {
        bm.ClearDiscouraged();
        CHECK_FALSE(bm.IsDiscouraged("node-a"));
    }

    SECTION("Bounded") {
        // Later entries expire later, so the first one is the victim
        for (size_t i = 0; i < BanMan::MAX_DISCOURAGED; ++i) {
            util::SetMockTime(200001 + static_cast<int64_t>(i));
            bm.Discourage("host-" + std::to_string(i));
        }
        CHECK_FALSE(bm.IsDiscouraged("node-a"));
        CHECK(bm.IsDiscouraged("host-0"));
    }
}
