// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Node lifecycle and fatal store errors

#include <catch2/catch_test_macros.hpp>
#include "network_test_helpers.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

using namespace chaincraft;
using namespace chaincraft::network;
using namespace chaincraft::test;

namespace {

class NodeTestFixture {
public:
    std::string test_dir;

    NodeTestFixture() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = "/tmp/chaincraft_node_test_" + std::to_string(now);
        std::filesystem::create_directory(test_dir);
    }

    ~NodeTestFixture() {
        std::filesystem::remove_all(test_dir);
    }
};

} // namespace

TEST_CASE("Node - Construction", "[network][node]") {
    auto net = SimulatedNetwork::Create();
    boost::asio::io_context io;

    SECTION("Unknown validator is rejected") {
        auto config = MakeTestNodeConfig();
        config.validator = "proof-of-nothing";
        REQUIRE_THROWS_AS(Node(config, std::make_shared<SimulatedTransport>(net, "node-a"), &io),
                          std::invalid_argument);
    }

    SECTION("Defaults are usable") {
        Node node(MakeTestNodeConfig(),
                  std::make_shared<SimulatedTransport>(net, "node-a"), &io);
        CHECK_FALSE(node.is_running());
        CHECK(node.consensus().validator().name() == "append-only");
        CHECK(node.dedup().capacity() == gossip::DedupCache::DEFAULT_CAPACITY);
        CHECK(node.get_local_nonce() != 0);
    }
}

TEST_CASE("Node - Start and stop", "[network][node]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");
    auto& b = net.AddNode("node-b");
    REQUIRE(a->is_running());

    SECTION("Second start is refused") {
        CHECK_FALSE(a->start());
    }

    SECTION("Stop closes every connection") {
        REQUIRE(net.Connect("node-a", "node-b"));
        a->stop();
        net.Pump();
        CHECK_FALSE(a->is_running());
        CHECK(a->peer_manager().connected_count() == 0);
        CHECK(b->peer_manager().connected_count() == 0);
    }

    SECTION("Restart after a clean stop") {
        a->stop();
        REQUIRE(a->start());
        REQUIRE(net.Connect("node-b", "node-a"));
        auto digest = b->submit_local(Bytes("after restart"));
        net.Pump();
        CHECK(a.store->contains(digest));
    }
}

TEST_CASE("Node - Unavailable store is fatal", "[network][node][fatal]") {
    TestNetwork net;
    auto& a = net.AddNode("node-a");
    auto& x = net.AddNode("node-x");

    int callbacks = 0;
    std::string what;
    x->set_fatal_error_callback([&](const std::string& w) {
        ++callbacks;
        what = w;
    });

    x.store->TestOnlySetUnavailable(true);

    SECTION("Local submit") {
        x->submit_local(Bytes("cannot persist"));

        CHECK(x->has_fatal_error());
        CHECK(x->gossip().has_fatal_error());
        CHECK(callbacks == 1);
        CHECK_FALSE(what.empty());
        CHECK(x->fatal_error() == what);

        // Halted: nothing else is validated
        auto before = x->consensus().validation_count();
        x->submit_local(Bytes("ignored"));
        CHECK(x->consensus().validation_count() == before);
        CHECK(callbacks == 1);
    }

    SECTION("Remote announce") {
        REQUIRE(net.Connect("node-a", "node-x"));
        a->submit_local(Bytes("remote"));
        net.Pump();

        CHECK(x->has_fatal_error());
        CHECK(callbacks == 1);
    }

    SECTION("No restart after a fatal error") {
        x->submit_local(Bytes("cannot persist"));
        REQUIRE(x->has_fatal_error());
        x->stop();
        CHECK_FALSE(x->start());
    }
}

TEST_CASE("Node - Ban list survives a restart", "[network][node][ban]") {
    NodeTestFixture fixture;
    auto sim = SimulatedNetwork::Create();
    boost::asio::io_context io;

    auto config = MakeTestNodeConfig();
    config.datadir = fixture.test_dir;

    {
        Node node(config, std::make_shared<SimulatedTransport>(sim, "node-a"), &io);
        REQUIRE(node.start());
        node.ban_man().Ban("node-z", 0, "operator");
        node.stop();
    }
    REQUIRE(std::filesystem::exists(fixture.test_dir + "/banlist.json"));

    Node node(config, std::make_shared<SimulatedTransport>(sim, "node-a"), &io);
    REQUIRE(node.start());
    CHECK(node.ban_man().IsBanned("node-z"));
    CHECK(node.connect_to(protocol::NetworkAddress("node-z", TEST_PORT)).error ==
          ConnError::Banned);
    node.stop();
}
