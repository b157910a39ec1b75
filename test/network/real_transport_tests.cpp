// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// RealTransport over loopback TCP

#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include "network/real_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

using namespace chaincraft;
using namespace chaincraft::network;

namespace {
// Try a small range of high ports so a busy one does not fail the run
uint16_t PickListenPort(RealTransport& t, AcceptCallback accept_cb,
                        uint16_t start = 43000, uint16_t end = 43100) {
    for (uint16_t p = start; p < end; ++p) {
        if (t.listen(p, accept_cb)) return p;
    }
    return 0;
}
} // namespace

TEST_CASE("RealTransport - Lifecycle is idempotent", "[network][transport][real]") {
    RealTransport t(1);
    CHECK_FALSE(t.is_running());

    // stop() before run() is safe
    t.stop();

    t.run();
    CHECK(t.is_running());
    t.run();
    CHECK(t.is_running());

    t.stop();
    t.stop();
    CHECK_FALSE(t.is_running());

    // Restartable
    t.run();
    CHECK(t.is_running());
    t.stop();
}

TEST_CASE("RealTransport - Listen twice is refused", "[network][transport][real]") {
    RealTransport t(1);
    t.run();
    uint16_t port = PickListenPort(t, [](TransportConnectionPtr) {});
    REQUIRE(port != 0);
    CHECK_FALSE(t.listen(port + 1, [](TransportConnectionPtr) {}));

    // Listening again works after stop_listening()
    t.stop_listening();
    CHECK(PickListenPort(t, [](TransportConnectionPtr) {}) != 0);
    t.stop();
}

TEST_CASE("RealTransport - Loopback frame delivery and close", "[network][transport][real]") {
    RealTransport server(1);
    RealTransport client(1);
    server.run();
    client.run();

    std::mutex m;
    std::condition_variable cv;
    TransportConnectionPtr inbound;
    std::vector<uint8_t> received;
    bool accepted = false;
    bool connected = false;
    bool inbound_closed = false;

    auto accept_cb = [&](TransportConnectionPtr c) {
        c->set_receive_callback([&](const std::vector<uint8_t>& data) {
            std::lock_guard<std::mutex> lk(m);
            received.insert(received.end(), data.begin(), data.end());
            cv.notify_all();
        });
        c->set_disconnect_callback([&]() {
            std::lock_guard<std::mutex> lk(m);
            inbound_closed = true;
            cv.notify_all();
        });
        {
            std::lock_guard<std::mutex> lk(m);
            inbound = c;
            accepted = true;
        }
        c->start();
        cv.notify_all();
    };

    uint16_t port = PickListenPort(server, accept_cb);
    REQUIRE(port != 0);

    TransportConnectionPtr conn;
    conn = client.connect("127.0.0.1", port, [&](bool ok) {
        std::lock_guard<std::mutex> lk(m);
        connected = ok;
        cv.notify_all();
    });
    REQUIRE(conn);
    CHECK_FALSE(conn->is_inbound());

    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3), [&] { return accepted && connected; });
    }
    REQUIRE(accepted);
    REQUIRE(connected);
    conn->start();

    CHECK(conn->remote_port() == port);
    CHECK_FALSE(conn->remote_address().empty());
    CHECK(inbound->is_inbound());
    CHECK(inbound->remote_port() != 0);

    message::PingMessage ping(0x1122334455667788ULL);
    auto frame = message::frame_message(protocol::magic::REGTEST, ping);
    REQUIRE(conn->send(frame));

    // TCP may split the frame; wait for all of it
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3),
                    [&] { return received.size() >= frame.size(); });
    }
    std::vector<uint8_t> bytes;
    {
        std::lock_guard<std::mutex> lk(m);
        bytes = received;
    }
    REQUIRE(bytes == frame);

    protocol::MessageHeader header;
    REQUIRE(message::deserialize_header(bytes.data(), bytes.size(), header));
    CHECK(header.get_command() == protocol::commands::PING);
    message::PingMessage decoded;
    REQUIRE(decoded.deserialize(bytes.data() + protocol::MESSAGE_HEADER_SIZE,
                                header.length));
    CHECK(decoded.nonce == ping.nonce);

    // Closing the client is seen by the server
    conn->close();
    CHECK_FALSE(conn->is_open());
    CHECK_FALSE(conn->send(frame));
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3), [&] { return inbound_closed; });
    }
    CHECK(inbound_closed);
    CHECK_FALSE(inbound->is_open());

    client.stop();
    server.stop();
}

TEST_CASE("RealTransport - Connect to a closed port fails", "[network][transport][real]") {
    RealTransport scratch_server(1);
    scratch_server.run();
    // Find a free port, then release it
    uint16_t port = PickListenPort(scratch_server, [](TransportConnectionPtr) {});
    REQUIRE(port != 0);
    scratch_server.stop();

    RealTransport client(1);
    client.run();

    std::mutex m;
    std::condition_variable cv;
    bool called = false;
    bool ok = true;

    auto conn = client.connect("127.0.0.1", port, [&](bool success) {
        std::lock_guard<std::mutex> lk(m);
        called = true;
        ok = success;
        cv.notify_all();
    });
    REQUIRE(conn);

    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3), [&] { return called; });
    }
    CHECK(called);
    CHECK_FALSE(ok);
    CHECK_FALSE(conn->is_open());
    client.stop();
}
