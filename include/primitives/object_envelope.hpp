// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_PRIMITIVES_OBJECT_ENVELOPE_HPP
#define CHAINCRAFT_PRIMITIVES_OBJECT_ENVELOPE_HPP

#include "primitives/digest.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace chaincraft {
namespace primitives {

/*
 ObjectEnvelope - payload convention understood by the stock validators

 Layout (little-endian):
   u8   version (= 1)
   u8   flags: bit0 slot present, bit1 signature present
   u64  slot                       (only if bit0)
   u8   dependency count N
   N x  32-byte digest
   u16  pubkey length, pubkey      (only if bit1)
   u16  signature length, sig      (only if bit1)
   ...  body (rest of payload)

 The gossip layer never parses envelopes; they are opaque payload bytes whose
 hash is the object digest. The signature covers the body only.
*/
struct ObjectEnvelope {
  static constexpr uint8_t VERSION = 1;
  static constexpr uint8_t FLAG_SLOT = 0x01;
  static constexpr uint8_t FLAG_SIGNATURE = 0x02;
  static constexpr size_t MAX_DEPENDENCIES = 255;

  std::optional<uint64_t> slot;
  std::vector<Digest> dependencies;
  std::vector<uint8_t> public_key;
  std::vector<uint8_t> signature;
  std::vector<uint8_t> body;

  bool has_signature() const { return !public_key.empty() || !signature.empty(); }
};

// Throws std::length_error if a field exceeds its length prefix
std::vector<uint8_t> EncodeEnvelope(const ObjectEnvelope &envelope);

// Returns nullopt for anything that does not parse as a version-1 envelope
std::optional<ObjectEnvelope> DecodeEnvelope(const uint8_t *data, size_t size);

inline std::optional<ObjectEnvelope>
DecodeEnvelope(const std::vector<uint8_t> &payload) {
  return DecodeEnvelope(payload.data(), payload.size());
}

} // namespace primitives
} // namespace chaincraft

#endif // CHAINCRAFT_PRIMITIVES_OBJECT_ENVELOPE_HPP
