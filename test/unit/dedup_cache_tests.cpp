// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Unit tests for the gossip dedup cache

#include <catch2/catch_test_macros.hpp>
#include "gossip/dedup_cache.hpp"
#include "util/time.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace chaincraft;
using namespace chaincraft::gossip;

namespace {
primitives::Digest MakeDigest(uint8_t tag) {
    std::array<uint8_t, primitives::Digest::SIZE> bytes{};
    bytes.fill(tag);
    return primitives::Digest(bytes);
}

DedupCache::Config SmallConfig(size_t capacity, size_t shards = 4) {
    DedupCache::Config config;
    config.capacity = capacity;
    config.shards = shards;
    config.ttl = std::chrono::seconds(60);
    return config;
}
} // namespace

TEST_CASE("DedupCache - Insert and contains", "[gossip][dedup][unit]") {
    DedupCache cache(SmallConfig(10));

    REQUIRE_FALSE(cache.contains(MakeDigest(1)));
    REQUIRE(cache.insert(MakeDigest(1)));
    REQUIRE(cache.contains(MakeDigest(1)));
    CHECK_FALSE(cache.insert(MakeDigest(1)));
    CHECK(cache.size() == 1);

    SECTION("Erase forgets the digest") {
        CHECK(cache.erase(MakeDigest(1)));
        CHECK_FALSE(cache.erase(MakeDigest(1)));
        CHECK_FALSE(cache.contains(MakeDigest(1)));
        CHECK(cache.insert(MakeDigest(1)));
    }
}

TEST_CASE("DedupCache - Oldest entry is evicted at capacity", "[gossip][dedup][unit]") {
    DedupCache cache(SmallConfig(3));

    for (uint8_t i = 1; i <= 4; ++i) {
        REQUIRE(cache.insert(MakeDigest(i)));
    }

    CHECK(cache.size() == 3);
    CHECK_FALSE(cache.contains(MakeDigest(1)));
    CHECK(cache.contains(MakeDigest(2)));
    CHECK(cache.contains(MakeDigest(3)));
    CHECK(cache.contains(MakeDigest(4)));

    // An evicted digest is novel again and pushes out the next oldest
    CHECK(cache.insert(MakeDigest(1)));
    CHECK_FALSE(cache.contains(MakeDigest(2)));
}

TEST_CASE("DedupCache - Entries expire after the TTL", "[gossip][dedup][unit]") {
    util::MockTimeScope mock_time(1000);
    DedupCache cache(SmallConfig(100));

    REQUIRE(cache.insert(MakeDigest(1)));
    util::SetMockTime(1030);
    REQUIRE(cache.insert(MakeDigest(2)));

    util::SetMockTime(1059);
    CHECK(cache.contains(MakeDigest(1)));

    util::SetMockTime(1060);
    CHECK_FALSE(cache.contains(MakeDigest(1)));
    CHECK(cache.contains(MakeDigest(2)));

    SECTION("Prune removes only expired entries") {
        CHECK(cache.prune() == 1);
        CHECK(cache.size() == 1);
    }

    SECTION("Expired digest counts as novel before pruning") {
        CHECK(cache.insert(MakeDigest(1)));
        CHECK(cache.size() == 2);
    }
}

TEST_CASE("DedupCache - Concurrent inserts of one digest", "[gossip][dedup][unit]") {
    DedupCache cache(SmallConfig(1000, 16));
    std::atomic<int> novel{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (uint8_t i = 0; i < 50; ++i) {
                if (cache.insert(MakeDigest(i))) {
                    novel.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(novel.load() == 50);
    CHECK(cache.size() == 50);
}
