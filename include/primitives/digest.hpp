// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_PRIMITIVES_DIGEST_HPP
#define CHAINCRAFT_PRIMITIVES_DIGEST_HPP

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace chaincraft {
namespace primitives {

/**
 * Digest - 32-byte content hash identifying a shared object
 *
 * Ordering is lexicographic over the raw bytes; consensus tie-breaks depend
 * on it, so it must stay byte-wise and platform independent.
 */
class Digest {
public:
  static constexpr size_t SIZE = 32;

  Digest() { data_.fill(0); }
  explicit Digest(const std::array<uint8_t, SIZE> &bytes) : data_(bytes) {}

  // Returns nullopt unless len == SIZE
  static std::optional<Digest> FromBytes(const uint8_t *data, size_t len);

  // Parses 64 hex characters (either case)
  static std::optional<Digest> FromHex(const std::string &hex);

  std::string GetHex() const;

  // First 8 bytes in hex, for log lines
  std::string ToShortString() const;

  bool IsNull() const;

  const uint8_t *data() const { return data_.data(); }
  uint8_t *data() { return data_.data(); }
  static constexpr size_t size() { return SIZE; }
  const std::array<uint8_t, SIZE> &bytes() const { return data_; }

  auto operator<=>(const Digest &other) const = default;
  bool operator==(const Digest &other) const = default;

private:
  std::array<uint8_t, SIZE> data_;
};

// Hash functor for unordered containers. Digests are already uniformly
// distributed, so the leading bytes are a sufficient bucket key.
struct DigestHasher {
  size_t operator()(const Digest &d) const noexcept {
    size_t h;
    std::memcpy(&h, d.data(), sizeof(h));
    return h;
  }
};

} // namespace primitives
} // namespace chaincraft

#endif // CHAINCRAFT_PRIMITIVES_DIGEST_HPP
