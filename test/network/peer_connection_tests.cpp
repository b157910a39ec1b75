// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Connection lifecycle: handshake, refusals, backoff, liveness, peer exchange

#include <catch2/catch_test_macros.hpp>
#include "network_test_helpers.hpp"
#include "util/time.hpp"
#include "version.hpp"

using namespace chaincraft;
using namespace chaincraft::network;
using namespace chaincraft::test;

TEST_CASE("PeerConnection - Handshake completes on both sides", "[network][peer]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");
    auto& b = net.AddNode("node-b");

    REQUIRE(net.Connect("node-a", "node-b"));

    REQUIRE(a->peer_manager().connected_count() == 1);
    REQUIRE(b->peer_manager().connected_count() == 1);

    auto out = a->peer_manager().find_record(b.address());
    REQUIRE(out.has_value());
    CHECK_FALSE(out->inbound);
    CHECK(out->state == PeerRecordState::Connected);

    auto in_peer = net.PeerHandle("node-b", "node-a");
    REQUIRE(in_peer);
    CHECK(in_peer->is_inbound());
    CHECK(in_peer->state() == PeerState::READY);
    CHECK(in_peer->user_agent() == protocol::GetUserAgent());
    CHECK(in_peer->peer_nonce() == a->get_local_nonce());

    // The inbound side learns where A listens
    auto in_rec = b->peer_manager().get_record(in_peer->id());
    REQUIRE(in_rec.has_value());
    REQUIRE(in_rec->listen_address.has_value());
    CHECK(*in_rec->listen_address == a.address());
}

TEST_CASE("PeerConnection - Connect results", "[network][peer]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");
    auto& b = net.AddNode("node-b");

    SECTION("Already connected") {
        REQUIRE(net.Connect("node-a", "node-b"));
        auto again = a->connect_to(b.address());
        CHECK(again.error == ConnError::AlreadyConnected);
    }

    SECTION("Inbound peer is not redialed on its listen address") {
        REQUIRE(net.Connect("node-a", "node-b"));
        auto back = b->connect_to(a.address());
        CHECK(back.error == ConnError::AlreadyConnected);
    }

    SECTION("Banned address") {
        a->ban_man().Ban(b.address().to_string(), 3600);
        auto result = a->connect_to(b.address());
        CHECK(result.error == ConnError::Banned);
        CHECK(b->peer_manager().connected_count() == 0);
    }

    SECTION("Invalid address") {
        auto result = a->connect_to(protocol::NetworkAddress("", 0));
        CHECK(result.error == ConnError::TransportFailed);
    }

    SECTION("Stopped node") {
        a->stop();
        auto result = a->connect_to(b.address());
        CHECK(result.error == ConnError::NotRunning);
    }
}

TEST_CASE("PeerConnection - Self connection is dropped", "[network][peer][handshake]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");

    auto result = a->connect_to(a.address());
    REQUIRE(result.ok());
    net.Pump();

    CHECK(a->peer_manager().connected_count() == 0);
    auto rec = a->peer_manager().get_record(result.peer_id);
    REQUIRE(rec.has_value());
    CHECK(rec->state != PeerRecordState::Connected);
}

TEST_CASE("PeerConnection - Network magic mismatch", "[network][peer][handshake]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");
    auto other = MakeTestNodeConfig();
    other.network_magic = protocol::magic::TESTNET;
    auto& b = net.AddNode("node-b", other);

    auto result = a->connect_to(b.address());
    REQUIRE(result.ok());
    net.Pump();

    CHECK(a->peer_manager().connected_count() == 0);
    CHECK(b->peer_manager().connected_count() == 0);
}

TEST_CASE("PeerConnection - Explicit disconnect", "[network][peer]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");
    auto& b = net.AddNode("node-b");
    REQUIRE(net.Connect("node-a", "node-b"));

    auto rec = a->peer_manager().find_record(b.address());
    REQUIRE(rec.has_value());
    REQUIRE(a->disconnect_from(rec->peer_id));
    CHECK_FALSE(a->disconnect_from(rec->peer_id));
    net.Pump();

    CHECK(a->peer_manager().connected_count() == 0);
    CHECK(b->peer_manager().connected_count() == 0);
    auto after = a->peer_manager().get_record(rec->peer_id);
    REQUIRE(after.has_value());
    CHECK(after->state == PeerRecordState::Disconnected);
    CHECK(after->failure_count == 0);

    // Same address keeps its peer id
    auto redial = a->connect_to(b.address());
    REQUIRE(redial.ok());
    CHECK(redial.peer_id == rec->peer_id);
}

TEST_CASE("PeerConnection - Failed dials back off and end in a ban", "[network][peer][backoff]") {
    util::MockTimeScope mock_time(5000);

    TestNetwork net;
    auto config = MakeTestNodeConfig();
    config.backoff_base = std::chrono::seconds(2);
    config.backoff_max = std::chrono::seconds(5);
    config.ban_threshold = 3;
    config.ban_duration = 600;
    auto& a = net.AddNode("node-a", config);

    // Nobody listens on this host
    protocol::NetworkAddress ghost("ghost", TEST_PORT);

    auto first = a->connect_to(ghost);
    CHECK(first.error == ConnError::TransportFailed);
    auto rec = a->peer_manager().find_record(ghost);
    REQUIRE(rec.has_value());
    CHECK(rec->failure_count == 1);
    CHECK(rec->state == PeerRecordState::Disconnected);

    SECTION("Retry inside the backoff window is refused") {
        CHECK(a->connect_to(ghost).error == ConnError::BackingOff);
        util::SetMockTime(5001);
        CHECK(a->connect_to(ghost).error == ConnError::BackingOff);
    }

    SECTION("Delay doubles, then the address is banned") {
        util::SetMockTime(5002);
        CHECK(a->connect_to(ghost).error == ConnError::TransportFailed);
        CHECK(a->peer_manager().find_record(ghost)->failure_count == 2);

        // 2s * 2 = 4s
        util::SetMockTime(5005);
        CHECK(a->connect_to(ghost).error == ConnError::BackingOff);
        util::SetMockTime(5006);
        CHECK(a->connect_to(ghost).error == ConnError::TransportFailed);

        auto banned = a->peer_manager().find_record(ghost);
        REQUIRE(banned.has_value());
        CHECK(banned->state == PeerRecordState::Banned);
        CHECK(a->ban_man().IsBanned(ghost.to_string()));
        CHECK(a->connect_to(ghost).error == ConnError::Banned);

        // Timed ban runs out
        util::SetMockTime(5006 + 601);
        a->ban_man().SweepBanned();
        CHECK_FALSE(a->ban_man().IsBanned(ghost.to_string()));
        CHECK(a->connect_to(ghost).error == ConnError::TransportFailed);
        CHECK(a->peer_manager().find_record(ghost)->failure_count == 1);
    }
}

TEST_CASE("PeerConnection - Silent peers time out", "[network][peer][liveness]") {
    util::MockTimeScope mock_time(10000);

    TestNetwork net;
    auto config = MakeTestNodeConfig();
    config.peer_timeout = std::chrono::seconds(120);
    auto& a = net.AddNode("node-a");
    auto& x = net.AddNode("node-x", config);
    REQUIRE(net.Connect("node-a", "node-x"));

    SECTION("Heartbeats keep the connection alive") {
        util::SetMockTime(10100);
        x->test_hook_heartbeat();
        net.Pump();

        util::SetMockTime(10200);
        x->test_hook_maintenance();
        net.Pump();
        CHECK(x->peer_manager().connected_count() == 1);
    }

    SECTION("No traffic past the timeout disconnects") {
        util::SetMockTime(10121);
        x->test_hook_maintenance();
        net.Pump();

        CHECK(x->peer_manager().connected_count() == 0);
        CHECK(a->peer_manager().connected_count() == 0);
    }
}

TEST_CASE("PeerConnection - Stalled handshake times out", "[network][peer][liveness]") {
    util::MockTimeScope mock_time(20000);

    TestNetwork net;
    auto config = MakeTestNodeConfig();
    config.handshake_timeout = std::chrono::seconds(60);
    auto& x = net.AddNode("node-x", config);
    auto& a = net.AddNode("node-a");

    // VERSION never leaves X
    x.transport->set_send_blocked("node-a", true);
    auto result = x->connect_to(a.address());
    REQUIRE(result.ok());
    net.Pump();
    REQUIRE(x->peer_manager().get_record(result.peer_id)->state ==
            PeerRecordState::Connecting);

    util::SetMockTime(20061);
    x->test_hook_maintenance();
    net.Pump();

    auto rec = x->peer_manager().get_record(result.peer_id);
    REQUIRE(rec.has_value());
    CHECK(rec->state == PeerRecordState::Disconnected);
    CHECK(rec->failure_count == 1);
}

TEST_CASE("PeerConnection - Peer exchange shares listen addresses", "[network][peer][discovery]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");
    auto& b = net.AddNode("node-b");
    auto& x = net.AddNode("node-x");

    REQUIRE(net.Connect("node-a", "node-x"));
    // B asks X for peers as soon as the handshake is done
    REQUIRE(net.Connect("node-b", "node-x"));

    auto known = b->peer_manager().discover();
    CHECK(known.count(a.address()) == 1);
    CHECK(known.count(x.address()) == 1);

    // Maintenance only dials up to min_peers
    b->test_hook_maintenance();
    net.Pump();
    CHECK(b->peer_manager().connected_count() == 1);

    auto result = b->connect_to(a.address());
    REQUIRE(result.ok());
    net.Pump();
    CHECK(b->peer_manager().connected_count() == 2);
}

TEST_CASE("PeerConnection - Bootstrap peers are dialed on start", "[network][peer][discovery]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");
    auto& b = net.AddNode("node-b");

    auto config = MakeTestNodeConfig();
    config.bootstrap_addresses = {a.address(), b.address()};
    auto& x = net.AddNode("node-x", config);
    net.Pump();

    CHECK(x->peer_manager().connected_count() == 2);
    CHECK(a->peer_manager().connected_count() == 1);
    CHECK(b->peer_manager().connected_count() == 1);
}
