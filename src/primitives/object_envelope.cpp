// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "primitives/object_envelope.hpp"
#include <limits>
#include <stdexcept>

namespace chaincraft {
namespace primitives {

namespace {
void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xff));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_blob16(std::vector<uint8_t> &out, const std::vector<uint8_t> &blob) {
  if (blob.size() > std::numeric_limits<uint16_t>::max()) {
    throw std::length_error("envelope field exceeds 65535 bytes");
  }
  put_u16(out, static_cast<uint16_t>(blob.size()));
  out.insert(out.end(), blob.begin(), blob.end());
}

// Bounds-checked cursor over the input
class Reader {
public:
  Reader(const uint8_t *data, size_t size) : data_(data), size_(size) {}

  bool read_u8(uint8_t &v) {
    if (remaining() < 1)
      return false;
    v = data_[pos_++];
    return true;
  }

  bool read_u16(uint16_t &v) {
    if (remaining() < 2)
      return false;
    v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
    pos_ += 2;
    return true;
  }

  bool read_u64(uint64_t &v) {
    if (remaining() < 8)
      return false;
    v = 0;
    for (int i = 7; i >= 0; --i) {
      v = (v << 8) | data_[pos_ + i];
    }
    pos_ += 8;
    return true;
  }

  bool read_bytes(std::vector<uint8_t> &out, size_t n) {
    if (remaining() < n)
      return false;
    out.assign(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return true;
  }

  size_t remaining() const { return size_ - pos_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t pos_{0};
};
} // namespace

std::vector<uint8_t> EncodeEnvelope(const ObjectEnvelope &envelope) {
  if (envelope.dependencies.size() > ObjectEnvelope::MAX_DEPENDENCIES) {
    throw std::length_error("envelope has more than 255 dependencies");
  }

  std::vector<uint8_t> out;
  out.reserve(3 + 8 + envelope.dependencies.size() * Digest::SIZE +
              envelope.public_key.size() + envelope.signature.size() + 4 +
              envelope.body.size());

  uint8_t flags = 0;
  if (envelope.slot)
    flags |= ObjectEnvelope::FLAG_SLOT;
  if (envelope.has_signature())
    flags |= ObjectEnvelope::FLAG_SIGNATURE;

  out.push_back(ObjectEnvelope::VERSION);
  out.push_back(flags);
  if (envelope.slot) {
    uint64_t slot = *envelope.slot;
    for (int i = 0; i < 8; ++i) {
      out.push_back(static_cast<uint8_t>(slot >> (8 * i)));
    }
  }

  out.push_back(static_cast<uint8_t>(envelope.dependencies.size()));
  for (const auto &dep : envelope.dependencies) {
    out.insert(out.end(), dep.bytes().begin(), dep.bytes().end());
  }

  if (envelope.has_signature()) {
    put_blob16(out, envelope.public_key);
    put_blob16(out, envelope.signature);
  }

  out.insert(out.end(), envelope.body.begin(), envelope.body.end());
  return out;
}

std::optional<ObjectEnvelope> DecodeEnvelope(const uint8_t *data, size_t size) {
  if (!data) {
    return std::nullopt;
  }

  Reader r(data, size);
  ObjectEnvelope env;

  uint8_t version = 0;
  uint8_t flags = 0;
  if (!r.read_u8(version) || version != ObjectEnvelope::VERSION) {
    return std::nullopt;
  }
  if (!r.read_u8(flags) ||
      (flags & ~(ObjectEnvelope::FLAG_SLOT | ObjectEnvelope::FLAG_SIGNATURE))) {
    return std::nullopt;
  }

  if (flags & ObjectEnvelope::FLAG_SLOT) {
    uint64_t slot = 0;
    if (!r.read_u64(slot))
      return std::nullopt;
    env.slot = slot;
  }

  uint8_t dep_count = 0;
  if (!r.read_u8(dep_count))
    return std::nullopt;
  env.dependencies.reserve(dep_count);
  for (uint8_t i = 0; i < dep_count; ++i) {
    std::vector<uint8_t> raw;
    if (!r.read_bytes(raw, Digest::SIZE))
      return std::nullopt;
    env.dependencies.push_back(*Digest::FromBytes(raw.data(), raw.size()));
  }

  if (flags & ObjectEnvelope::FLAG_SIGNATURE) {
    uint16_t len = 0;
    if (!r.read_u16(len) || !r.read_bytes(env.public_key, len))
      return std::nullopt;
    if (!r.read_u16(len) || !r.read_bytes(env.signature, len))
      return std::nullopt;
  }

  if (!r.read_bytes(env.body, r.remaining()))
    return std::nullopt;
  return env;
}

} // namespace primitives
} // namespace chaincraft
