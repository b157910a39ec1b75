// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Unit tests for network/peer_manager.cpp - address table, bans and misbehavior
//
// PeerManager is driven directly on a SimulatedTransport. Multi-node behavior
// (handshakes, eviction, liveness) is covered in test/network.

#include <catch2/catch_test_macros.hpp>
#include "network/peer_manager.hpp"
#include "network/simulated_transport.hpp"
#include "util/time.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp needs std::exchange
#include <boost/asio.hpp>

using namespace chaincraft;
using namespace chaincraft::network;

namespace {

class PeerManagerFixture {
public:
    boost::asio::io_context io_context;
    std::shared_ptr<SimulatedNetwork> sim;
    std::shared_ptr<SimulatedTransport> transport;
    BanMan banman;

    PeerManagerFixture()
        : sim(SimulatedNetwork::Create()),
          transport(std::make_shared<SimulatedTransport>(sim, "local")) {
        transport->run();
    }

    std::unique_ptr<PeerManager> Create(PeerManager::Config config = {}) {
        config.network_magic = protocol::magic::REGTEST;
        config.local_nonce = 0xabcdef;
        return std::make_unique<PeerManager>(io_context, transport, banman, config);
    }
};

protocol::NetworkAddress Addr(const std::string& host, uint16_t port = 9000) {
    return protocol::NetworkAddress(host, port);
}

} // namespace

TEST_CASE("PeerManager - Lifecycle", "[network][peer_manager][unit]") {
    PeerManagerFixture fixture;

    SECTION("Start twice") {
        auto pm = fixture.Create();
        REQUIRE(pm->start());
        CHECK_FALSE(pm->start());
        CHECK(pm->is_running());
        pm->stop();
        CHECK_FALSE(pm->is_running());
    }

    SECTION("No transport") {
        PeerManager pm(fixture.io_context, nullptr, fixture.banman);
        CHECK_FALSE(pm.start());
    }

    SECTION("Dialing before start") {
        auto pm = fixture.Create();
        CHECK(pm->connect(Addr("remote")).error == ConnError::NotRunning);
        CHECK(pm->record_count() == 0);
    }

    SECTION("Peer ids start at 1") {
        auto pm = fixture.Create();
        CHECK(pm->allocate_peer_id() == 1);
        CHECK(pm->allocate_peer_id() == 2);
    }
}

TEST_CASE("PeerManager - Discovery", "[network][peer_manager][discovery][unit]") {
    PeerManagerFixture fixture;
    PeerManager::Config config;
    config.bootstrap_addresses = {Addr("seed-1"), Addr("seed-2")};
    auto pm = fixture.Create(config);
    REQUIRE(pm->start());

    SECTION("Bootstrap addresses become records") {
        auto known = pm->discover();
        CHECK(known == std::set<protocol::NetworkAddress>{Addr("seed-1"), Addr("seed-2")});
        CHECK(pm->record_count() == 2);
        auto rec = pm->find_record(Addr("seed-1"));
        REQUIRE(rec.has_value());
        CHECK(rec->state == PeerRecordState::Discovered);
        CHECK_FALSE(rec->inbound);

        // Idempotent
        pm->discover();
        CHECK(pm->record_count() == 2);
    }

    SECTION("Learned addresses are merged once") {
        pm->add_known_addresses({Addr("learned"), protocol::NetworkAddress("", 0),
                                 Addr("seed-1")});
        auto known = pm->discover();
        CHECK(known.size() == 3);
        CHECK(known.count(Addr("learned")) == 1);
        CHECK(pm->record_count() == 3);
    }

    SECTION("Banned and discouraged addresses are skipped") {
        fixture.banman.Ban(Addr("seed-1").to_string(), 3600);
        fixture.banman.Discourage("seed-2");
        pm->add_known_addresses({Addr("other")});
        auto known = pm->discover();
        CHECK(known == std::set<protocol::NetworkAddress>{Addr("other")});
    }

    SECTION("A host-wide ban covers every port") {
        fixture.banman.Ban("seed-1", 0);
        auto known = pm->discover();
        CHECK(known.count(Addr("seed-1")) == 0);
        CHECK(pm->connect(Addr("seed-1", 9001)).error == ConnError::Banned);
    }
}

TEST_CASE("PeerManager - Failed dials", "[network][peer_manager][backoff][unit]") {
    util::MockTimeScope mock_time(1000000);
    PeerManagerFixture fixture;
    PeerManager::Config config;
    config.backoff_base = std::chrono::seconds(1);
    config.backoff_max = std::chrono::seconds(8);
    config.ban_threshold = 0; // never ban
    auto pm = fixture.Create(config);
    REQUIRE(pm->start());

    auto first = pm->connect(Addr("nowhere"));
    CHECK(first.error == ConnError::TransportFailed);
    REQUIRE(first.peer_id != NO_PEER_ID);

    SECTION("The record keeps its id") {
        util::SetMockTime(1000001);
        auto second = pm->connect(Addr("nowhere"));
        CHECK(second.error == ConnError::TransportFailed);
        CHECK(second.peer_id == first.peer_id);
        CHECK(pm->record_count() == 1);
    }

    SECTION("Delay is capped at backoff_max") {
        int64_t now = 1000000;
        for (uint32_t failures = 1; failures < 10; ++failures) {
            // 1, 2, 4, 8, 8, ...
            int64_t delay = std::min<int64_t>(int64_t{1} << (failures - 1), 8);
            now += delay;
            util::SetMockTime(now);
            CHECK(pm->connect(Addr("nowhere")).error == ConnError::TransportFailed);
        }
        auto rec = pm->find_record(Addr("nowhere"));
        REQUIRE(rec.has_value());
        CHECK(rec->failure_count == 10);
        CHECK(rec->state == PeerRecordState::Disconnected);

        util::SetMockTime(now + 7);
        CHECK(pm->connect(Addr("nowhere")).error == ConnError::BackingOff);
    }

    SECTION("Stale records are pruned") {
        pm->discover();
        CHECK(pm->prune_stale(std::chrono::hours(3)) == 0);

        util::SetMockTime(1000000 + 3 * 3600 + 1);
        CHECK(pm->prune_stale(std::chrono::hours(3)) == 1);
        CHECK_FALSE(pm->find_record(Addr("nowhere")).has_value());
    }
}

TEST_CASE("PeerManager - Dial limits", "[network][peer_manager][unit]") {
    PeerManagerFixture fixture;

    // Accepts links but never answers, so dials stay in Connecting
    auto remote = std::make_shared<SimulatedTransport>(fixture.sim, "remote");
    std::vector<TransportConnectionPtr> accepted;
    remote->run();
    REQUIRE(remote->listen(9000, [&](TransportConnectionPtr conn) {
        accepted.push_back(conn);
    }));

    PeerManager::Config config;
    config.max_connecting = 1;
    auto pm = fixture.Create(config);
    REQUIRE(pm->start());

    auto first = pm->connect(Addr("remote"));
    REQUIRE(first.ok());
    CHECK(pm->get_record(first.peer_id)->state == PeerRecordState::Connecting);

    CHECK(pm->connect(Addr("remote")).error == ConnError::AlreadyConnected);
    CHECK(pm->connect(Addr("elsewhere")).error == ConnError::CapacityExceeded);

    pm->stop();
    fixture.io_context.poll();
}

TEST_CASE("PeerManager - Operator bans", "[network][peer_manager][ban][unit]") {
    PeerManagerFixture fixture;
    PeerManager::Config config;
    config.bootstrap_addresses = {Addr("seed-1"), Addr("seed-2")};
    auto pm = fixture.Create(config);
    REQUIRE(pm->start());
    pm->discover();

    pm->ban_address(Addr("seed-1").to_string(), 0, "operator");
    CHECK(fixture.banman.IsBanned(Addr("seed-1").to_string()));
    CHECK_FALSE(pm->find_record(Addr("seed-1")).has_value());
    CHECK(pm->find_record(Addr("seed-2")).has_value());
    CHECK(pm->connect(Addr("seed-1")).error == ConnError::Banned);
}

TEST_CASE("PeerManager - Misbehavior scoring", "[network][peer_manager][misbehavior][unit]") {
    PeerManagerFixture fixture;
    PeerManager::Config config;
    config.bootstrap_addresses = {Addr("noisy")};
    auto pm = fixture.Create(config);
    REQUIRE(pm->start());
    pm->discover();
    auto rec = pm->find_record(Addr("noisy"));
    REQUIRE(rec.has_value());
    const PeerId id = rec->peer_id;

    SECTION("Penalties accumulate") {
        pm->ReportSendQueueFull(id);
        pm->ReportProtocolViolation(id, "bad frame");
        pm->ReportIntegrityViolation(id, "digest mismatch");
        CHECK(pm->GetMisbehaviorScore(id) ==
              MisbehaviorPenalty::SEND_QUEUE_FULL + MisbehaviorPenalty::PROTOCOL_VIOLATION +
                  MisbehaviorPenalty::INTEGRITY_VIOLATION);
        CHECK_FALSE(pm->ShouldDisconnect(id));
        CHECK_FALSE(fixture.banman.IsDiscouraged("noisy"));
    }

    SECTION("Threshold discourages the host") {
        for (int i = 0; i < DISCOURAGEMENT_THRESHOLD / MisbehaviorPenalty::PROTOCOL_VIOLATION; ++i) {
            pm->ReportProtocolViolation(id, "bad frame");
        }
        CHECK(pm->GetMisbehaviorScore(id) == DISCOURAGEMENT_THRESHOLD);
        CHECK(pm->ShouldDisconnect(id));
        CHECK(fixture.banman.IsDiscouraged("noisy"));
        // Not a ban
        CHECK_FALSE(fixture.banman.IsBanned(Addr("noisy").to_string()));
        fixture.io_context.poll();

        CHECK(pm->connect(Addr("noisy")).error == ConnError::Banned);
    }

    SECTION("Unknown peer") {
        pm->ReportIntegrityViolation(9999, "nobody");
        CHECK(pm->GetMisbehaviorScore(9999) == 0);
        CHECK_FALSE(pm->ShouldDisconnect(9999));
    }
}
