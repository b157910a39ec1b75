// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// In-memory transport used by the multi-node tests

#include <catch2/catch_test_macros.hpp>
#include "network/simulated_transport.hpp"
#include <vector>

using namespace chaincraft::network;

TEST_CASE("SimulatedTransport - Links and delivery", "[network][transport][simulated]") {
    auto sim = SimulatedNetwork::Create();
    auto a = std::make_shared<SimulatedTransport>(sim, "host-a");
    auto b = std::make_shared<SimulatedTransport>(sim, "host-b");
    a->run();
    b->run();

    TransportConnectionPtr inbound;
    REQUIRE(b->listen(9000, [&](TransportConnectionPtr conn) { inbound = conn; }));
    // One listener per transport
    CHECK_FALSE(b->listen(9001, nullptr));

    bool connected = false;
    auto outbound = a->connect("host-b", 9000, [&](bool ok) { connected = ok; });
    REQUIRE(outbound);
    REQUIRE(inbound);
    CHECK(connected);

    CHECK_FALSE(outbound->is_inbound());
    CHECK(outbound->remote_address() == "host-b");
    CHECK(outbound->remote_port() == 9000);
    CHECK(inbound->is_inbound());
    CHECK(inbound->remote_address() == "host-a");
    CHECK(inbound->remote_port() == 40000);
    CHECK(a->connection_count() == 1);
    CHECK(b->connection_count() == 1);

    std::vector<std::vector<uint8_t>> received;
    inbound->set_receive_callback([&](const std::vector<uint8_t>& data) {
        received.push_back(data);
    });

    SECTION("Nothing moves until the network is pumped") {
        REQUIRE(outbound->send({1, 2, 3}));
        REQUIRE(outbound->send({4}));
        CHECK(received.empty());
        CHECK(sim->pending_messages() == 2);

        CHECK(sim->process_messages() == 2);
        REQUIRE(received.size() == 2);
        CHECK(received[0] == std::vector<uint8_t>{1, 2, 3});
        CHECK(received[1] == std::vector<uint8_t>{4});
    }

    SECTION("Blocked senders hold frames") {
        a->set_send_blocked("host-b", true);
        REQUIRE(outbound->send({9}));
        CHECK(outbound->pending_sends() == 1);
        sim->process_messages();
        CHECK(received.empty());

        a->set_send_blocked("host-b", false);
        CHECK(outbound->pending_sends() == 0);
        sim->process_messages();
        CHECK(received.size() == 1);
    }

    SECTION("Close reaches the other end") {
        bool remote_closed = false;
        inbound->set_disconnect_callback([&]() { remote_closed = true; });
        outbound->close();
        CHECK_FALSE(outbound->is_open());
        CHECK_FALSE(outbound->send({1}));

        sim->process_messages();
        CHECK(remote_closed);
        CHECK_FALSE(inbound->is_open());
    }

    SECTION("Stopping a transport closes its connections") {
        bool remote_closed = false;
        inbound->set_disconnect_callback([&]() { remote_closed = true; });
        a->stop();
        sim->process_messages();
        CHECK(remote_closed);
        CHECK(a->connection_count() == 0);
    }

    a->stop();
    b->stop();
}

TEST_CASE("SimulatedTransport - Refused connections", "[network][transport][simulated]") {
    auto sim = SimulatedNetwork::Create();
    auto a = std::make_shared<SimulatedTransport>(sim, "host-a");
    a->run();

    bool called = false;
    CHECK(a->connect("nobody", 9000, [&](bool) { called = true; }) == nullptr);
    CHECK_FALSE(called);

    SECTION("Listener removed") {
        auto b = std::make_shared<SimulatedTransport>(sim, "host-b");
        REQUIRE(b->listen(9000, nullptr));
        b->stop_listening();
        CHECK(a->connect("host-b", 9000, nullptr) == nullptr);
    }
}
