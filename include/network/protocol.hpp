// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_PROTOCOL_HPP
#define CHAINCRAFT_PROTOCOL_HPP

#include "version.hpp"
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace chaincraft {
namespace protocol {

// Protocol version - increment when the gossip wire format changes
constexpr uint32_t PROTOCOL_VERSION = 1;

// Peers announcing an older version are disconnected during the handshake
constexpr uint32_t MIN_PROTOCOL_VERSION = 1;

// Network magic bytes - first four bytes of every frame
namespace magic {
constexpr uint32_t MAINNET = 0x43484346; // "CHCF"
constexpr uint32_t TESTNET = 0x9D3A51E7;
constexpr uint32_t REGTEST = 0x2F6B8C04;
} // namespace magic

constexpr uint16_t DEFAULT_PORT = 8080;

// Message types - 12 bytes, null-padded
namespace commands {
// Handshake
constexpr const char *VERSION = "version";
constexpr const char *VERACK = "verack";

// Keep-alive
constexpr const char *PING = "ping";
constexpr const char *PONG = "pong";

// Object gossip (pull model: announce -> request -> object)
constexpr const char *ANNOUNCE = "announce";
constexpr const char *REQUEST = "request";
constexpr const char *OBJECT = "object";

// Peer exchange
constexpr const char *GETPEERS = "getpeers";
constexpr const char *PEERS = "peers";
} // namespace commands

// Message header constants
constexpr size_t MESSAGE_HEADER_SIZE = 24;
constexpr size_t COMMAND_SIZE = 12;
constexpr size_t CHECKSUM_SIZE = 4;

// Serialization limits
constexpr uint64_t MAX_SIZE = 0x02000000; // 32 MB - largest length prefix accepted
constexpr size_t MAX_PROTOCOL_MESSAGE_LENGTH = 4 * 1000 * 1000; // single frame
constexpr size_t DEFAULT_RECV_FLOOD_SIZE = 5 * 1000 * 1000;     // per-peer receive buffer
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 16 * 1000 * 1000;    // bytes queued per TCP socket
constexpr size_t MAX_PEERS_ADDRESSES = 1000; // entries per PEERS message
constexpr size_t MAX_USER_AGENT_LENGTH = 256;

// Connection policy defaults
constexpr size_t DEFAULT_MAX_PEERS = 50;
constexpr size_t DEFAULT_MIN_PEERS = 1;
constexpr size_t DEFAULT_SEND_QUEUE_LIMIT = 1000; // messages per peer

// Timeouts and intervals (in seconds)
constexpr int HEARTBEAT_INTERVAL_SEC = 30;
constexpr int PEER_TIMEOUT_SEC = 120;
constexpr int VERSION_HANDSHAKE_TIMEOUT_SEC = 60;
constexpr int MAINTENANCE_INTERVAL_SEC = 5;

// Reconnect backoff: base * 2^(failures-1), capped
constexpr int DEFAULT_BACKOFF_BASE_SEC = 1;
constexpr int DEFAULT_BACKOFF_MAX_SEC = 300;
constexpr uint32_t DEFAULT_BAN_THRESHOLD = 8;
constexpr int64_t DEFAULT_BAN_DURATION_SEC = 24 * 60 * 60;

inline std::string GetUserAgent() { return chaincraft::GetUserAgent(); }

// Message header structure (24 bytes):
// magic (4 bytes), command (12 bytes null-padded), length (4 bytes), checksum
// (4 bytes)
struct MessageHeader {
  uint32_t magic;
  std::array<char, COMMAND_SIZE> command;
  uint32_t length;
  std::array<uint8_t, CHECKSUM_SIZE> checksum;

  MessageHeader();
  MessageHeader(uint32_t magic, const std::string &cmd, uint32_t len);

  // Get command as string (strips null padding)
  std::string get_command() const;

  // Set command from string (adds null padding)
  void set_command(const std::string &cmd);
};

// NetworkAddress - "host:port" endpoint. Host is kept textual so the same
// type works for TCP (IPv4/IPv6 literals, hostnames) and simulated hubs.
struct NetworkAddress {
  std::string host;
  uint16_t port{0};

  NetworkAddress() = default;
  NetworkAddress(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

  // "1.2.3.4:8080", "[::1]:8080", "node-a:9000"; nullopt if malformed
  static std::optional<NetworkAddress> from_string(const std::string &str);

  // Brackets IPv6 literals
  std::string to_string() const;

  bool is_valid() const { return !host.empty() && port != 0; }

  auto operator<=>(const NetworkAddress &) const = default;
  bool operator==(const NetworkAddress &) const = default;
};

} // namespace protocol
} // namespace chaincraft

#endif // CHAINCRAFT_PROTOCOL_HPP
