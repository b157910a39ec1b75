// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_MESSAGE_HPP
#define CHAINCRAFT_MESSAGE_HPP

#include "network/protocol.hpp"
#include "primitives/digest.hpp"
#include "primitives/shared_object.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chaincraft {
namespace message {

// Variable-length integer (Bitcoin CompactSize):
// < 0xfd: 1 byte, <= 0xffff: 0xfd + u16, <= 0xffffffff: 0xfe + u32, else 0xff + u64
struct VarInt {
  uint64_t value;

  explicit VarInt(uint64_t v = 0) : value(v) {}

  static size_t size(uint64_t v);

  // Writes into buffer, returns bytes written (buffer needs 9 bytes)
  size_t encode(uint8_t *buffer) const;

  // Returns bytes consumed, 0 on truncated input or non-canonical encoding
  size_t decode(const uint8_t *buffer, size_t available);
};

// Little-endian writer
class MessageSerializer {
public:
  void write_uint8(uint8_t v);
  void write_uint16(uint16_t v);
  void write_uint32(uint32_t v);
  void write_uint64(uint64_t v);
  void write_int64(int64_t v);
  void write_varint(uint64_t v);
  void write_bytes(const uint8_t *data, size_t len);
  void write_bytes(const std::vector<uint8_t> &data);
  void write_string(const std::string &s); // varint length + bytes
  void write_digest(const primitives::Digest &d);

  const std::vector<uint8_t> &data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
};

// Bounds-checked reader. After the first failure every read returns a zero
// value and has_error() stays true.
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t> &buffer);

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int64_t read_int64();
  // Rejects values above protocol::MAX_SIZE
  uint64_t read_varint();
  std::vector<uint8_t> read_bytes(size_t len);
  std::string read_string(size_t max_len);
  primitives::Digest read_digest();

  size_t bytes_remaining() const { return size_ - pos_; }
  bool has_error() const { return error_; }

private:
  bool require(size_t n);

  const uint8_t *data_;
  size_t size_;
  size_t pos_{0};
  bool error_{false};
};

// Base class for every wire message
class Message {
public:
  virtual ~Message() = default;
  virtual std::string command() const = 0;
  virtual std::vector<uint8_t> serialize() const = 0;
  // False on malformed input or trailing bytes
  virtual bool deserialize(const uint8_t *data, size_t size) = 0;
};

// VERSION - first message on every connection
class VersionMessage : public Message {
public:
  uint32_t version{protocol::PROTOCOL_VERSION};
  int64_t timestamp{0};
  uint64_t nonce{0};        // self-connection detection
  uint16_t listen_port{0};  // 0 = not accepting inbound
  std::string user_agent;

  std::string command() const override { return protocol::commands::VERSION; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

class VerackMessage : public Message {
public:
  std::string command() const override { return protocol::commands::VERACK; }
  std::vector<uint8_t> serialize() const override { return {}; }
  bool deserialize(const uint8_t *data, size_t size) override;
};

class PingMessage : public Message {
public:
  uint64_t nonce{0};

  PingMessage() = default;
  explicit PingMessage(uint64_t n) : nonce(n) {}

  std::string command() const override { return protocol::commands::PING; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

class PongMessage : public Message {
public:
  uint64_t nonce{0};

  PongMessage() = default;
  explicit PongMessage(uint64_t n) : nonce(n) {}

  std::string command() const override { return protocol::commands::PONG; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

// ANNOUNCE - "I hold this object"
class AnnounceMessage : public Message {
public:
  primitives::Digest digest;

  AnnounceMessage() = default;
  explicit AnnounceMessage(const primitives::Digest &d) : digest(d) {}

  std::string command() const override { return protocol::commands::ANNOUNCE; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

// REQUEST - pull an announced object
class RequestMessage : public Message {
public:
  primitives::Digest digest;

  RequestMessage() = default;
  explicit RequestMessage(const primitives::Digest &d) : digest(d) {}

  std::string command() const override { return protocol::commands::REQUEST; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

// OBJECT - full payload. The digest is claimed by the sender and must be
// re-checked against hash(payload) by the receiver.
class ObjectMessage : public Message {
public:
  primitives::Digest digest;
  primitives::ObjectKind kind{primitives::ObjectKind::Custom};
  std::vector<uint8_t> payload;

  std::string command() const override { return protocol::commands::OBJECT; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

class GetPeersMessage : public Message {
public:
  std::string command() const override { return protocol::commands::GETPEERS; }
  std::vector<uint8_t> serialize() const override { return {}; }
  bool deserialize(const uint8_t *data, size_t size) override;
};

// PEERS - up to MAX_PEERS_ADDRESSES "host:port" strings
class PeersMessage : public Message {
public:
  std::vector<protocol::NetworkAddress> addresses;

  std::string command() const override { return protocol::commands::PEERS; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

// Factory by command; nullptr for unknown commands
std::unique_ptr<Message> create_message(const std::string &command);

// Framing helpers
std::array<uint8_t, protocol::CHECKSUM_SIZE>
compute_checksum(const std::vector<uint8_t> &payload);

protocol::MessageHeader create_header(uint32_t magic, const std::string &command,
                                      const std::vector<uint8_t> &payload);

std::vector<uint8_t> serialize_header(const protocol::MessageHeader &header);

// False if size < MESSAGE_HEADER_SIZE or length exceeds the frame limit
bool deserialize_header(const uint8_t *data, size_t size,
                        protocol::MessageHeader &header);

// Header + payload in one buffer
std::vector<uint8_t> frame_message(uint32_t magic, const Message &msg);

} // namespace message
} // namespace chaincraft

#endif // CHAINCRAFT_MESSAGE_HPP
