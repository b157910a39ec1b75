// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_STORAGE_MEMORY_OBJECT_STORE_HPP
#define CHAINCRAFT_STORAGE_MEMORY_OBJECT_STORE_HPP

#include "storage/object_store.hpp"
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace chaincraft {
namespace storage {

// In-memory ObjectStore. Used by the daemon by default and by tests.
class MemoryObjectStore : public ObjectStore {
public:
  void put(const primitives::Digest &key,
           const std::vector<uint8_t> &bytes) override;
  std::optional<std::vector<uint8_t>>
  get(const primitives::Digest &key) const override;
  bool contains(const primitives::Digest &key) const override;

  size_t size() const;
  size_t put_count() const { return puts_.load(std::memory_order_relaxed); }

  // Test-only: make every subsequent call throw StoreUnavailableError
  void TestOnlySetUnavailable(bool unavailable) { unavailable_ = unavailable; }

private:
  void check_available() const;

  mutable std::mutex mutex_;
  std::unordered_map<primitives::Digest, std::vector<uint8_t>,
                     primitives::DigestHasher>
      objects_;
  std::atomic<size_t> puts_{0};
  std::atomic<bool> unavailable_{false};
};

} // namespace storage
} // namespace chaincraft

#endif // CHAINCRAFT_STORAGE_MEMORY_OBJECT_STORE_HPP
