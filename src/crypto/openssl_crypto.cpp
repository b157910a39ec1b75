// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "crypto/openssl_crypto.hpp"
#include "util/logging.hpp"
#include <memory>
#include <stdexcept>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace chaincraft {
namespace crypto {

namespace {
struct PkeyDeleter {
  void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *c) const { EVP_MD_CTX_free(c); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX *c) const { EVP_PKEY_CTX_free(c); }
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

// EVP one-shot APIs reject a null buffer even for zero length
const uint8_t kEmpty = 0;
const uint8_t *buf_or_empty(const Bytes &b) {
  return b.empty() ? &kEmpty : b.data();
}

std::string last_openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0)
    return "unknown";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}
} // namespace

std::array<uint8_t, 32> Sha256(const uint8_t *data, size_t len) {
  std::array<uint8_t, 32> out{};
  unsigned int out_len = 0;
  if (EVP_Digest(len ? data : &kEmpty, len, out.data(), &out_len, EVP_sha256(),
                 nullptr) != 1) {
    // Only fails on allocation failure inside OpenSSL
    throw std::runtime_error("EVP_Digest(SHA-256) failed: " +
                             last_openssl_error());
  }
  return out;
}

std::array<uint8_t, 32> Sha256d(const uint8_t *data, size_t len) {
  auto first = Sha256(data, len);
  return Sha256(first.data(), first.size());
}

primitives::Digest OpenSslCrypto::hash(const Bytes &data) const {
  return primitives::Digest(Sha256(data.data(), data.size()));
}

bool OpenSslCrypto::verify(const Bytes &public_key, const Bytes &signature,
                           const Bytes &message) const {
  if (public_key.size() != ED25519_KEY_SIZE ||
      signature.size() != ED25519_SIG_SIZE) {
    return false;
  }

  PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                           public_key.data(),
                                           public_key.size()));
  if (!pkey) {
    LOG_CRYPTO_DEBUG("rejecting malformed ed25519 public key: {}",
                     last_openssl_error());
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    LOG_CRYPTO_ERROR("EVP_DigestVerifyInit failed: {}", last_openssl_error());
    return false;
  }

  int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            buf_or_empty(message), message.size());
  if (rc != 1) {
    ERR_clear_error();
    return false;
  }
  return true;
}

std::optional<Bytes> OpenSslCrypto::sign(const Bytes &private_key,
                                         const Bytes &message) const {
  if (private_key.size() != ED25519_KEY_SIZE) {
    LOG_CRYPTO_WARN("sign: private key must be {} bytes (got {})",
                    ED25519_KEY_SIZE, private_key.size());
    return std::nullopt;
  }

  PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                            private_key.data(),
                                            private_key.size()));
  if (!pkey) {
    LOG_CRYPTO_ERROR("EVP_PKEY_new_raw_private_key failed: {}",
                     last_openssl_error());
    return std::nullopt;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    LOG_CRYPTO_ERROR("EVP_DigestSignInit failed: {}", last_openssl_error());
    return std::nullopt;
  }

  Bytes sig(ED25519_SIG_SIZE);
  size_t sig_len = sig.size();
  if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, buf_or_empty(message),
                     message.size()) != 1) {
    LOG_CRYPTO_ERROR("EVP_DigestSign failed: {}", last_openssl_error());
    return std::nullopt;
  }
  sig.resize(sig_len);
  return sig;
}

std::optional<KeyPair> OpenSslCrypto::generate_keypair() {
  PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!pctx || EVP_PKEY_keygen_init(pctx.get()) != 1) {
    LOG_CRYPTO_ERROR("ed25519 keygen init failed: {}", last_openssl_error());
    return std::nullopt;
  }

  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &raw) != 1) {
    LOG_CRYPTO_ERROR("ed25519 keygen failed: {}", last_openssl_error());
    return std::nullopt;
  }
  PkeyPtr pkey(raw);

  KeyPair kp;
  kp.private_key.resize(ED25519_KEY_SIZE);
  kp.public_key.resize(ED25519_KEY_SIZE);
  size_t priv_len = kp.private_key.size();
  size_t pub_len = kp.public_key.size();
  if (EVP_PKEY_get_raw_private_key(pkey.get(), kp.private_key.data(),
                                   &priv_len) != 1 ||
      EVP_PKEY_get_raw_public_key(pkey.get(), kp.public_key.data(),
                                  &pub_len) != 1) {
    LOG_CRYPTO_ERROR("failed to export ed25519 key: {}", last_openssl_error());
    return std::nullopt;
  }
  return kp;
}

std::optional<Bytes> OpenSslCrypto::derive_public_key(const Bytes &private_key) {
  if (private_key.size() != ED25519_KEY_SIZE) {
    return std::nullopt;
  }
  PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                            private_key.data(),
                                            private_key.size()));
  if (!pkey) {
    return std::nullopt;
  }
  Bytes pub(ED25519_KEY_SIZE);
  size_t pub_len = pub.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &pub_len) != 1) {
    return std::nullopt;
  }
  return pub;
}

} // namespace crypto
} // namespace chaincraft
