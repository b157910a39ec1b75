// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Unit tests for network/message_router.cpp

#include <catch2/catch_test_macros.hpp>
#include "network/message_router.hpp"
#include "network/peer_manager.hpp"
#include "network/simulated_transport.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp needs std::exchange
#include <boost/asio.hpp>

using namespace chaincraft;
using namespace chaincraft::network;

namespace {

// A peer without a connection: enough for routing decisions
PeerPtr MakeDetachedPeer(boost::asio::io_context& io, int id) {
    auto peer = Peer::create_inbound(io, nullptr, Peer::Options{});
    peer->set_id(id);
    return peer;
}

} // namespace

TEST_CASE("MessageRouter - Missing handlers", "[network][router][unit]") {
    boost::asio::io_context io;
    MessageRouter router(nullptr, nullptr);
    auto peer = MakeDetachedPeer(io, 1);

    CHECK_FALSE(router.RouteMessage(nullptr, std::make_unique<message::GetPeersMessage>()));
    CHECK_FALSE(router.RouteMessage(peer, nullptr));
    CHECK_FALSE(router.RouteMessage(peer, std::make_unique<message::AnnounceMessage>()));
    CHECK_FALSE(router.RouteMessage(peer, std::make_unique<message::GetPeersMessage>()));
    CHECK_FALSE(router.RouteMessage(peer, std::make_unique<message::PeersMessage>()));
}

TEST_CASE("MessageRouter - Peer exchange and unexpected messages", "[network][router][unit]") {
    boost::asio::io_context io;
    auto sim = SimulatedNetwork::Create();
    auto transport = std::make_shared<SimulatedTransport>(sim, "local");
    BanMan banman;

    PeerManager::Config config;
    config.bootstrap_addresses = {protocol::NetworkAddress("seed", 9000)};
    PeerManager pm(io, transport, banman, config);
    REQUIRE(pm.start());
    pm.discover();
    auto rec = pm.find_record(protocol::NetworkAddress("seed", 9000));
    REQUIRE(rec.has_value());

    MessageRouter router(&pm, nullptr);
    auto peer = MakeDetachedPeer(io, rec->peer_id);

    SECTION("PEERS feeds discovery") {
        auto msg = std::make_unique<message::PeersMessage>();
        msg->addresses = {protocol::NetworkAddress("learned", 9000)};
        REQUIRE(router.RouteMessage(peer, std::move(msg)));

        auto known = pm.discover();
        CHECK(known.count(protocol::NetworkAddress("learned", 9000)) == 1);
    }

    SECTION("Handshake messages after the handshake are a protocol violation") {
        CHECK_FALSE(router.RouteMessage(peer, std::make_unique<message::VerackMessage>()));
        CHECK(pm.GetMisbehaviorScore(rec->peer_id) ==
              MisbehaviorPenalty::PROTOCOL_VIOLATION);
    }

    pm.stop();
    io.poll();
}
