// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_STORAGE_OBJECT_STORE_HPP
#define CHAINCRAFT_STORAGE_OBJECT_STORE_HPP

#include "primitives/digest.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

namespace chaincraft {
namespace storage {

// Thrown by a store that can no longer serve requests (disk gone, handle
// closed). The node treats it as fatal.
class StoreUnavailableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * ObjectStore - content-addressed persistence for shared object payloads
 *
 * Contract: put() followed by get() of the same key from the same node is
 * immediately visible. Implementations provide their own internal locking.
 * Any method may throw StoreUnavailableError.
 */
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  virtual void put(const primitives::Digest &key,
                   const std::vector<uint8_t> &bytes) = 0;
  virtual std::optional<std::vector<uint8_t>>
  get(const primitives::Digest &key) const = 0;
  virtual bool contains(const primitives::Digest &key) const = 0;
};

} // namespace storage
} // namespace chaincraft

#endif // CHAINCRAFT_STORAGE_OBJECT_STORE_HPP
