// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "primitives/digest.hpp"

namespace chaincraft {
namespace primitives {

namespace {
constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}
} // namespace

std::optional<Digest> Digest::FromBytes(const uint8_t *data, size_t len) {
  if (!data || len != SIZE) {
    return std::nullopt;
  }
  Digest d;
  std::memcpy(d.data_.data(), data, SIZE);
  return d;
}

std::optional<Digest> Digest::FromHex(const std::string &hex) {
  if (hex.size() != SIZE * 2) {
    return std::nullopt;
  }
  Digest d;
  for (size_t i = 0; i < SIZE; ++i) {
    int hi = hex_value(hex[2 * i]);
    int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    d.data_[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return d;
}

std::string Digest::GetHex() const {
  std::string out;
  out.reserve(SIZE * 2);
  for (uint8_t b : data_) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0f]);
  }
  return out;
}

std::string Digest::ToShortString() const { return GetHex().substr(0, 16); }

bool Digest::IsNull() const {
  for (uint8_t b : data_) {
    if (b != 0)
      return false;
  }
  return true;
}

} // namespace primitives
} // namespace chaincraft
