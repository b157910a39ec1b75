// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Unit tests for objects parked on a missing dependency

#include <catch2/catch_test_macros.hpp>
#include "crypto/openssl_crypto.hpp"
#include "gossip/deferred_pool.hpp"
#include "util/time.hpp"

using namespace chaincraft;
using namespace chaincraft::gossip;

namespace {
primitives::SharedObjectPtr MakeObject(const std::string& text) {
    std::vector<uint8_t> payload(text.begin(), text.end());
    crypto::OpenSslCrypto crypto;
    return primitives::MakeSharedObject(crypto.hash(payload),
                                        primitives::ObjectKind::Custom, payload,
                                        1, 0);
}
} // namespace

TEST_CASE("DeferredPool - Park and release", "[gossip][deferred][unit]") {
    DeferredPool pool;
    auto dep = MakeObject("dependency")->digest;
    auto a = MakeObject("a");
    auto b = MakeObject("b");

    REQUIRE(pool.park(a, dep) == DeferredPool::ParkResult::Parked);
    REQUIRE(pool.park(b, dep) == DeferredPool::ParkResult::Parked);
    CHECK(pool.park(a, dep) == DeferredPool::ParkResult::AlreadyParked);
    CHECK(pool.size() == 2);
    CHECK(pool.waiting_on(dep) == 2);
    CHECK(pool.contains(a->digest));

    auto released = pool.release(dep);
    REQUIRE(released.size() == 2);
    // Arrival order
    CHECK(released[0].object->digest == a->digest);
    CHECK(released[1].object->digest == b->digest);
    CHECK(pool.size() == 0);
    CHECK(pool.release(dep).empty());
}

TEST_CASE("DeferredPool - Bounds", "[gossip][deferred][unit]") {
    DeferredPool::Config config;
    config.max_entries = 2;
    config.max_retries = 1;
    config.ttl = std::chrono::seconds(30);
    auto dep = MakeObject("dep")->digest;

    SECTION("Full pool refuses new objects") {
        DeferredPool pool(config);
        REQUIRE(pool.park(MakeObject("1"), dep) == DeferredPool::ParkResult::Parked);
        REQUIRE(pool.park(MakeObject("2"), dep) == DeferredPool::ParkResult::Parked);
        CHECK(pool.park(MakeObject("3"), dep) == DeferredPool::ParkResult::PoolFull);
        CHECK(pool.size() == 2);
    }

    SECTION("Retries are capped") {
        DeferredPool pool(config);
        CHECK(pool.park(MakeObject("1"), dep, 1) == DeferredPool::ParkResult::Parked);
        CHECK(pool.park(MakeObject("2"), dep, 2) ==
              DeferredPool::ParkResult::RetriesExhausted);
    }

    SECTION("Old entries expire") {
        util::MockTimeScope mock_time(2000);
        DeferredPool pool(config);
        REQUIRE(pool.park(MakeObject("old"), dep) == DeferredPool::ParkResult::Parked);
        util::SetMockTime(2020);
        REQUIRE(pool.park(MakeObject("new"), dep) == DeferredPool::ParkResult::Parked);

        util::SetMockTime(2030);
        auto expired = pool.expire();
        REQUIRE(expired.size() == 1);
        CHECK(expired[0].missing == dep);
        CHECK(pool.size() == 1);
        CHECK(pool.waiting_on(dep) == 1);
    }
}
