// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "storage/memory_object_store.hpp"

namespace chaincraft {
namespace storage {

void MemoryObjectStore::check_available() const {
  if (unavailable_.load(std::memory_order_relaxed)) {
    throw StoreUnavailableError("memory object store marked unavailable");
  }
}

void MemoryObjectStore::put(const primitives::Digest &key,
                            const std::vector<uint8_t> &bytes) {
  check_available();
  std::lock_guard<std::mutex> lock(mutex_);
  // Content-addressed: an existing entry already holds identical bytes
  if (objects_.emplace(key, bytes).second) {
    puts_.fetch_add(1, std::memory_order_relaxed);
  }
}

std::optional<std::vector<uint8_t>>
MemoryObjectStore::get(const primitives::Digest &key) const {
  check_available();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(key);
  if (it == objects_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryObjectStore::contains(const primitives::Digest &key) const {
  check_available();
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.find(key) != objects_.end();
}

size_t MemoryObjectStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.size();
}

} // namespace storage
} // namespace chaincraft
