// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_PRIMITIVES_SHARED_OBJECT_HPP
#define CHAINCRAFT_PRIMITIVES_SHARED_OBJECT_HPP

#include "primitives/digest.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace chaincraft {

// Peer identifiers are assigned by the peer manager. 0 is the local node
// itself (locally submitted objects), -1 means "no peer".
using PeerId = int;
constexpr PeerId LOCAL_PEER_ID = 0;
constexpr PeerId NO_PEER_ID = -1;

namespace primitives {

enum class ObjectKind : uint8_t {
  Transaction = 0,
  Block = 1,
  Vote = 2,
  Custom = 3,
};

const char *ObjectKindName(ObjectKind kind);

// Wire byte to kind; nullopt for unknown values
std::optional<ObjectKind> ObjectKindFromByte(uint8_t value);

/**
 * SharedObject - immutable, content-addressed unit of gossiped data
 *
 * digest == hash(payload) always holds for instances built by MakeSharedObject;
 * kind, origin_peer and received_at are not part of the identity.
 */
struct SharedObject {
  Digest digest;
  ObjectKind kind{ObjectKind::Custom};
  std::vector<uint8_t> payload;
  std::optional<PeerId> origin_peer;
  int64_t received_at{0}; // unix seconds (mockable)

  bool is_local() const {
    return origin_peer.has_value() && *origin_peer == LOCAL_PEER_ID;
  }
};

using SharedObjectPtr = std::shared_ptr<const SharedObject>;

SharedObjectPtr MakeSharedObject(const Digest &digest, ObjectKind kind,
                                 std::vector<uint8_t> payload,
                                 std::optional<PeerId> origin_peer,
                                 int64_t received_at);

} // namespace primitives
} // namespace chaincraft

#endif // CHAINCRAFT_PRIMITIVES_SHARED_OBJECT_HPP
