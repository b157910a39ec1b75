// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_CRYPTO_OPENSSL_CRYPTO_HPP
#define CHAINCRAFT_CRYPTO_OPENSSL_CRYPTO_HPP

#include "crypto/crypto_provider.hpp"
#include <array>

namespace chaincraft {
namespace crypto {

// Single SHA-256 over a buffer
std::array<uint8_t, 32> Sha256(const uint8_t *data, size_t len);

// SHA-256(SHA-256(data)), used for wire checksums
std::array<uint8_t, 32> Sha256d(const uint8_t *data, size_t len);

struct KeyPair {
  Bytes private_key; // 32-byte Ed25519 seed
  Bytes public_key;  // 32 bytes
};

/**
 * OpenSslCrypto - CryptoProvider backed by OpenSSL EVP
 *
 * hash: SHA-256
 * sign/verify: Ed25519 over raw 32-byte keys, 64-byte signatures
 */
class OpenSslCrypto : public CryptoProvider {
public:
  static constexpr size_t ED25519_KEY_SIZE = 32;
  static constexpr size_t ED25519_SIG_SIZE = 64;

  primitives::Digest hash(const Bytes &data) const override;
  bool verify(const Bytes &public_key, const Bytes &signature,
              const Bytes &message) const override;
  std::optional<Bytes> sign(const Bytes &private_key,
                            const Bytes &message) const override;

  // Fresh Ed25519 key pair; nullopt if the OpenSSL keygen fails
  static std::optional<KeyPair> generate_keypair();

  // Public key for a raw private key
  static std::optional<Bytes> derive_public_key(const Bytes &private_key);
};

} // namespace crypto
} // namespace chaincraft

#endif // CHAINCRAFT_CRYPTO_OPENSSL_CRYPTO_HPP
