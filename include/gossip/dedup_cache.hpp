// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_GOSSIP_DEDUP_CACHE_HPP
#define CHAINCRAFT_GOSSIP_DEDUP_CACHE_HPP

#include "primitives/digest.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace chaincraft {
namespace gossip {

/**
 * DedupCache - "have we already seen this digest?"
 *
 * Bounded by entry count and by age. When full, the single oldest entry
 * (by first_seen) across all shards is evicted. Expired and evicted digests
 * are forgotten completely: inserting one again reports it as novel.
 *
 * Sharded by digest; each shard keeps its entries in insertion order so the
 * oldest is always at the front. A global sequence number breaks ties
 * between shards.
 */
class DedupCache {
public:
  static constexpr size_t DEFAULT_CAPACITY = 100000;
  static constexpr std::chrono::seconds DEFAULT_TTL{600};
  static constexpr size_t DEFAULT_SHARDS = 16;

  struct Config {
    size_t capacity;
    std::chrono::seconds ttl;
    size_t shards;

    Config()
        : capacity(DEFAULT_CAPACITY), ttl(DEFAULT_TTL), shards(DEFAULT_SHARDS) {}
  };

  explicit DedupCache(const Config &config = Config{});

  DedupCache(const DedupCache &) = delete;
  DedupCache &operator=(const DedupCache &) = delete;

  bool contains(const primitives::Digest &digest) const;

  // Atomic test-and-insert. True if the digest was novel (and is now cached).
  bool insert(const primitives::Digest &digest);

  // Forget a digest whose processing was cancelled. True if it was present.
  bool erase(const primitives::Digest &digest);

  // Drop entries older than ttl. Returns the number removed.
  size_t prune();

  size_t size() const { return size_.load(std::memory_order_relaxed); }
  size_t capacity() const { return config_.capacity; }

private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    Clock::time_point first_seen;
    uint64_t seq;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<primitives::Digest, Entry, primitives::DigestHasher> entries;
    // Insertion order; stale items (erased or re-inserted) are skipped lazily
    std::deque<std::pair<uint64_t, primitives::Digest>> order;
  };

  Shard &shard_for(const primitives::Digest &digest) const;
  bool expired(const Entry &entry, Clock::time_point now) const;

  // Discard stale items at the front of a shard's order queue. Lock held.
  static void trim_front_locked(Shard &shard);
  // Remove the globally oldest entry; false if the cache is empty
  bool evict_oldest();

  Config config_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<size_t> size_{0};
  std::atomic<uint64_t> next_seq_{1};
};

} // namespace gossip
} // namespace chaincraft

#endif // CHAINCRAFT_GOSSIP_DEDUP_CACHE_HPP
