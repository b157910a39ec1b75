// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "gossip/dedup_cache.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <limits>

namespace chaincraft {
namespace gossip {

DedupCache::DedupCache(const Config &config) : config_(config) {
  if (config_.shards == 0) {
    config_.shards = 1;
  }
  if (config_.capacity == 0) {
    config_.capacity = 1;
  }
  shards_.reserve(config_.shards);
  for (size_t i = 0; i < config_.shards; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

DedupCache::Shard &DedupCache::shard_for(const primitives::Digest &digest) const {
  return *shards_[primitives::DigestHasher{}(digest) % shards_.size()];
}

bool DedupCache::expired(const Entry &entry, Clock::time_point now) const {
  return now - entry.first_seen >= config_.ttl;
}

void DedupCache::trim_front_locked(Shard &shard) {
  while (!shard.order.empty()) {
    const auto &[seq, digest] = shard.order.front();
    auto it = shard.entries.find(digest);
    if (it != shard.entries.end() && it->second.seq == seq) {
      return;
    }
    shard.order.pop_front();
  }
}

bool DedupCache::contains(const primitives::Digest &digest) const {
  Shard &shard = shard_for(digest);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(digest);
  return it != shard.entries.end() && !expired(it->second, util::GetSteadyTime());
}

bool DedupCache::insert(const primitives::Digest &digest) {
  const auto now = util::GetSteadyTime();
  {
    Shard &shard = shard_for(digest);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(digest);
    if (it != shard.entries.end()) {
      if (!expired(it->second, now)) {
        return false;
      }
      // Aged out but not yet pruned: counts as novel
      shard.entries.erase(it);
      size_.fetch_sub(1, std::memory_order_relaxed);
    }
    uint64_t seq = next_seq_.fetch_add(1, std::memory_order_relaxed);
    shard.entries.emplace(digest, Entry{now, seq});
    shard.order.emplace_back(seq, digest);
    size_.fetch_add(1, std::memory_order_relaxed);
  }

  while (size_.load(std::memory_order_relaxed) > config_.capacity) {
    if (!evict_oldest()) {
      break;
    }
  }
  return true;
}

bool DedupCache::erase(const primitives::Digest &digest) {
  Shard &shard = shard_for(digest);
  std::lock_guard<std::mutex> lock(shard.mutex);
  if (shard.entries.erase(digest) == 0) {
    return false;
  }
  size_.fetch_sub(1, std::memory_order_relaxed);
  return true;
}

bool DedupCache::evict_oldest() {
  // Shard locks are never held together; a concurrent insert can at worst
  // make us evict the second-oldest entry
  size_t victim_shard = shards_.size();
  uint64_t victim_seq = std::numeric_limits<uint64_t>::max();
  for (size_t i = 0; i < shards_.size(); ++i) {
    Shard &shard = *shards_[i];
    std::lock_guard<std::mutex> lock(shard.mutex);
    trim_front_locked(shard);
    if (!shard.order.empty() && shard.order.front().first < victim_seq) {
      victim_seq = shard.order.front().first;
      victim_shard = i;
    }
  }
  if (victim_shard == shards_.size()) {
    return false;
  }

  Shard &shard = *shards_[victim_shard];
  std::lock_guard<std::mutex> lock(shard.mutex);
  trim_front_locked(shard);
  if (shard.order.empty()) {
    return true; // raced with erase(); size already adjusted
  }
  primitives::Digest digest = shard.order.front().second;
  shard.order.pop_front();
  if (shard.entries.erase(digest) > 0) {
    size_.fetch_sub(1, std::memory_order_relaxed);
    LOG_GOSSIP_TRACE("dedup evicted {}", digest.ToShortString());
  }
  return true;
}

size_t DedupCache::prune() {
  const auto now = util::GetSteadyTime();
  size_t removed = 0;
  for (auto &shard_ptr : shards_) {
    Shard &shard = *shard_ptr;
    std::lock_guard<std::mutex> lock(shard.mutex);
    // Insertion order is first_seen order, so expiry stops at the first live one
    while (true) {
      trim_front_locked(shard);
      if (shard.order.empty()) {
        break;
      }
      auto it = shard.entries.find(shard.order.front().second);
      if (!expired(it->second, now)) {
        break;
      }
      shard.entries.erase(it);
      shard.order.pop_front();
      size_.fetch_sub(1, std::memory_order_relaxed);
      ++removed;
    }
  }
  if (removed > 0) {
    LOG_GOSSIP_DEBUG("dedup pruned {} expired entries ({} remain)", removed,
                     size());
  }
  return removed;
}

} // namespace gossip
} // namespace chaincraft
