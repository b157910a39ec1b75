// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_GOSSIP_DEFERRED_POOL_HPP
#define CHAINCRAFT_GOSSIP_DEFERRED_POOL_HPP

#include "primitives/digest.hpp"
#include "primitives/shared_object.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace chaincraft {
namespace gossip {

// An object the consensus engine could not decide yet because it depends on
// one it has not committed
struct DeferredEntry {
  primitives::SharedObjectPtr object;
  primitives::Digest missing;
  uint32_t attempt{0}; // times re-deferred on the same dependency
  std::chrono::steady_clock::time_point parked_at;
};

/**
 * DeferredPool - objects waiting for a dependency, keyed by that dependency
 *
 * Bounded three ways: per-object retries, age (ttl) and total entries.
 * A retry is a release that left the object waiting on the same dependency;
 * moving on to the next missing dependency does not count. An unreachable
 * dependency is bounded by ttl. When full, the newest object is refused.
 */
class DeferredPool {
public:
  static constexpr uint32_t DEFAULT_MAX_RETRIES = 5;
  static constexpr std::chrono::seconds DEFAULT_TTL{300};
  static constexpr size_t DEFAULT_MAX_ENTRIES = 10000;

  struct Config {
    uint32_t max_retries;
    std::chrono::seconds ttl;
    size_t max_entries;

    Config()
        : max_retries(DEFAULT_MAX_RETRIES), ttl(DEFAULT_TTL),
          max_entries(DEFAULT_MAX_ENTRIES) {}
  };

  enum class ParkResult { Parked, AlreadyParked, PoolFull, RetriesExhausted };

  explicit DeferredPool(const Config &config = Config{});

  ParkResult park(primitives::SharedObjectPtr object,
                  const primitives::Digest &missing, uint32_t attempt = 0);

  // Remove and return every entry waiting on dependency
  std::vector<DeferredEntry> release(const primitives::Digest &dependency);

  // Remove and return entries older than ttl
  std::vector<DeferredEntry> expire();

  bool contains(const primitives::Digest &digest) const;
  size_t size() const;
  size_t waiting_on(const primitives::Digest &dependency) const;

  const Config &config() const { return config_; }

private:
  Config config_;
  mutable std::mutex mutex_;
  // dependency -> entries, in arrival order
  std::map<primitives::Digest, std::vector<DeferredEntry>> by_dependency_;
  // parked object -> the dependency it is filed under
  std::unordered_map<primitives::Digest, primitives::Digest,
                     primitives::DigestHasher>
      parked_;
};

const char *ParkResultName(DeferredPool::ParkResult result);

} // namespace gossip
} // namespace chaincraft

#endif // CHAINCRAFT_GOSSIP_DEFERRED_POOL_HPP
