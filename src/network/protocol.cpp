// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/protocol.hpp"
#include <algorithm>
#include <charconv>
#include <cstring>

namespace chaincraft {
namespace protocol {

// MessageHeader implementation
MessageHeader::MessageHeader() : magic(0), length(0) {
  command.fill(0);
  checksum.fill(0);
}

MessageHeader::MessageHeader(uint32_t magic, const std::string &cmd,
                             uint32_t len)
    : magic(magic), length(len) {
  set_command(cmd);
  checksum.fill(0); // Checksum set separately
}

std::string MessageHeader::get_command() const {
  auto end = std::find(command.begin(), command.end(), '\0');
  return std::string(command.begin(), end);
}

void MessageHeader::set_command(const std::string &cmd) {
  command.fill(0);
  size_t copy_len = std::min(cmd.length(), COMMAND_SIZE);
  std::memcpy(command.data(), cmd.data(), copy_len);
}

// NetworkAddress implementation
std::optional<NetworkAddress> NetworkAddress::from_string(const std::string &str) {
  std::string host;
  std::string port_str;

  if (!str.empty() && str.front() == '[') {
    auto close = str.find(']');
    if (close == std::string::npos || close + 1 >= str.size() ||
        str[close + 1] != ':') {
      return std::nullopt;
    }
    host = str.substr(1, close - 1);
    port_str = str.substr(close + 2);
  } else {
    auto colon = str.rfind(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    host = str.substr(0, colon);
    // Bare IPv6 without brackets is ambiguous
    if (host.find(':') != std::string::npos) {
      return std::nullopt;
    }
    port_str = str.substr(colon + 1);
  }

  if (host.empty() || port_str.empty()) {
    return std::nullopt;
  }

  unsigned int port = 0;
  auto [ptr, ec] =
      std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
  if (ec != std::errc() || ptr != port_str.data() + port_str.size() ||
      port == 0 || port > 65535) {
    return std::nullopt;
  }

  return NetworkAddress(host, static_cast<uint16_t>(port));
}

std::string NetworkAddress::to_string() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

} // namespace protocol
} // namespace chaincraft
