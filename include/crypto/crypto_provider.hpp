// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_CRYPTO_PROVIDER_HPP
#define CHAINCRAFT_CRYPTO_PROVIDER_HPP

#include "primitives/digest.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace chaincraft {
namespace crypto {

using Bytes = std::vector<uint8_t>;

/**
 * CryptoProvider - hashing and signature capability
 *
 * The gossip engine only uses hash() (digest recomputation at the wire
 * boundary). Validators use verify(); sign() is for local producers.
 * Implementations must be safe to call from multiple threads.
 */
class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual primitives::Digest hash(const Bytes &data) const = 0;

  // False for malformed keys or signatures as well as for a bad signature
  virtual bool verify(const Bytes &public_key, const Bytes &signature,
                      const Bytes &message) const = 0;

  // nullopt if the private key is unusable
  virtual std::optional<Bytes> sign(const Bytes &private_key,
                                    const Bytes &message) const = 0;
};

} // namespace crypto
} // namespace chaincraft

#endif // CHAINCRAFT_CRYPTO_PROVIDER_HPP
