// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "network/message.hpp"
#include "crypto/openssl_crypto.hpp"
#include <cstring>

namespace chaincraft {
namespace message {

// VarInt implementation
size_t VarInt::size(uint64_t v) {
  if (v < 0xfd)
    return 1;
  if (v <= 0xffff)
    return 3;
  if (v <= 0xffffffff)
    return 5;
  return 9;
}

size_t VarInt::encode(uint8_t *buffer) const {
  if (value < 0xfd) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  }
  size_t width;
  if (value <= 0xffff) {
    buffer[0] = 0xfd;
    width = 2;
  } else if (value <= 0xffffffff) {
    buffer[0] = 0xfe;
    width = 4;
  } else {
    buffer[0] = 0xff;
    width = 8;
  }
  for (size_t i = 0; i < width; ++i) {
    buffer[1 + i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return 1 + width;
}

size_t VarInt::decode(const uint8_t *buffer, size_t available) {
  if (available < 1)
    return 0;

  uint8_t first = buffer[0];
  if (first < 0xfd) {
    value = first;
    return 1;
  }

  size_t width = first == 0xfd ? 2 : (first == 0xfe ? 4 : 8);
  if (available < 1 + width)
    return 0;

  uint64_t v = 0;
  for (size_t i = 0; i < width; ++i) {
    v |= static_cast<uint64_t>(buffer[1 + i]) << (8 * i);
  }

  // Canonical encoding only
  uint64_t min_value = width == 2 ? 0xfd : (width == 4 ? 0x10000 : 0x100000000ULL);
  if (v < min_value)
    return 0;

  value = v;
  return 1 + width;
}

// MessageSerializer implementation
void MessageSerializer::write_uint8(uint8_t v) { buffer_.push_back(v); }

void MessageSerializer::write_uint16(uint16_t v) {
  buffer_.push_back(static_cast<uint8_t>(v));
  buffer_.push_back(static_cast<uint8_t>(v >> 8));
}

void MessageSerializer::write_uint32(uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
}

void MessageSerializer::write_uint64(uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
}

void MessageSerializer::write_int64(int64_t v) {
  write_uint64(static_cast<uint64_t>(v));
}

void MessageSerializer::write_varint(uint64_t v) {
  uint8_t tmp[9];
  size_t n = VarInt(v).encode(tmp);
  buffer_.insert(buffer_.end(), tmp, tmp + n);
}

void MessageSerializer::write_bytes(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void MessageSerializer::write_bytes(const std::vector<uint8_t> &data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void MessageSerializer::write_string(const std::string &s) {
  write_varint(s.size());
  buffer_.insert(buffer_.end(), s.begin(), s.end());
}

void MessageSerializer::write_digest(const primitives::Digest &d) {
  write_bytes(d.data(), primitives::Digest::SIZE);
}

// MessageDeserializer implementation
MessageDeserializer::MessageDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t> &buffer)
    : data_(buffer.data()), size_(buffer.size()) {}

bool MessageDeserializer::require(size_t n) {
  if (error_ || size_ - pos_ < n) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!require(1))
    return 0;
  return data_[pos_++];
}

uint16_t MessageDeserializer::read_uint16() {
  if (!require(2))
    return 0;
  uint16_t v = static_cast<uint16_t>(data_[pos_]) |
               static_cast<uint16_t>(data_[pos_ + 1]) << 8;
  pos_ += 2;
  return v;
}

uint32_t MessageDeserializer::read_uint32() {
  if (!require(4))
    return 0;
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
  }
  pos_ += 4;
  return v;
}

uint64_t MessageDeserializer::read_uint64() {
  if (!require(8))
    return 0;
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
  }
  pos_ += 8;
  return v;
}

int64_t MessageDeserializer::read_int64() {
  return static_cast<int64_t>(read_uint64());
}

uint64_t MessageDeserializer::read_varint() {
  if (error_)
    return 0;
  VarInt vi;
  size_t consumed = vi.decode(data_ + pos_, size_ - pos_);
  if (consumed == 0) {
    error_ = true;
    return 0;
  }
  // SECURITY: a length prefix above MAX_SIZE would drive a huge allocation
  if (vi.value > protocol::MAX_SIZE) {
    error_ = true;
    return 0;
  }
  pos_ += consumed;
  return vi.value;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t len) {
  if (!require(len))
    return {};
  std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + len);
  pos_ += len;
  return out;
}

std::string MessageDeserializer::read_string(size_t max_len) {
  uint64_t len = read_varint();
  if (error_)
    return {};
  if (len > max_len) {
    error_ = true;
    return {};
  }
  if (!require(static_cast<size_t>(len)))
    return {};
  std::string out(reinterpret_cast<const char *>(data_ + pos_),
                  static_cast<size_t>(len));
  pos_ += static_cast<size_t>(len);
  return out;
}

primitives::Digest MessageDeserializer::read_digest() {
  if (!require(primitives::Digest::SIZE))
    return primitives::Digest();
  auto d = primitives::Digest::FromBytes(data_ + pos_, primitives::Digest::SIZE);
  pos_ += primitives::Digest::SIZE;
  return d ? *d : primitives::Digest();
}

// Messages

std::vector<uint8_t> VersionMessage::serialize() const {
  MessageSerializer s;
  s.write_uint32(version);
  s.write_int64(timestamp);
  s.write_uint64(nonce);
  s.write_uint16(listen_port);
  s.write_string(user_agent);
  return s.release();
}

bool VersionMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  version = d.read_uint32();
  timestamp = d.read_int64();
  nonce = d.read_uint64();
  listen_port = d.read_uint16();
  user_agent = d.read_string(protocol::MAX_USER_AGENT_LENGTH);
  return !d.has_error() && d.bytes_remaining() == 0;
}

bool VerackMessage::deserialize(const uint8_t *data, size_t size) {
  (void)data;
  return size == 0;
}

std::vector<uint8_t> PingMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.release();
}

bool PingMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  nonce = d.read_uint64();
  return !d.has_error() && d.bytes_remaining() == 0;
}

std::vector<uint8_t> PongMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.release();
}

bool PongMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  nonce = d.read_uint64();
  return !d.has_error() && d.bytes_remaining() == 0;
}

std::vector<uint8_t> AnnounceMessage::serialize() const {
  MessageSerializer s;
  s.write_digest(digest);
  return s.release();
}

bool AnnounceMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  digest = d.read_digest();
  return !d.has_error() && d.bytes_remaining() == 0;
}

std::vector<uint8_t> RequestMessage::serialize() const {
  MessageSerializer s;
  s.write_digest(digest);
  return s.release();
}

bool RequestMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  digest = d.read_digest();
  return !d.has_error() && d.bytes_remaining() == 0;
}

std::vector<uint8_t> ObjectMessage::serialize() const {
  MessageSerializer s;
  s.write_digest(digest);
  s.write_uint8(static_cast<uint8_t>(kind));
  s.write_varint(payload.size());
  s.write_bytes(payload);
  return s.release();
}

bool ObjectMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  digest = d.read_digest();
  auto parsed_kind = primitives::ObjectKindFromByte(d.read_uint8());
  uint64_t len = d.read_varint();
  if (d.has_error() || !parsed_kind ||
      len > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    return false;
  }
  kind = *parsed_kind;
  payload = d.read_bytes(static_cast<size_t>(len));
  return !d.has_error() && d.bytes_remaining() == 0;
}

bool GetPeersMessage::deserialize(const uint8_t *data, size_t size) {
  (void)data;
  return size == 0;
}

std::vector<uint8_t> PeersMessage::serialize() const {
  MessageSerializer s;
  s.write_varint(addresses.size());
  for (const auto &addr : addresses) {
    s.write_string(addr.to_string());
  }
  return s.release();
}

bool PeersMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  uint64_t count = d.read_varint();
  if (d.has_error() || count > protocol::MAX_PEERS_ADDRESSES) {
    return false;
  }

  addresses.clear();
  addresses.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    // "[ipv6]:65535" fits comfortably
    std::string entry = d.read_string(300);
    if (d.has_error()) {
      return false;
    }
    auto addr = protocol::NetworkAddress::from_string(entry);
    if (!addr) {
      return false;
    }
    addresses.push_back(std::move(*addr));
  }
  return d.bytes_remaining() == 0;
}

std::unique_ptr<Message> create_message(const std::string &command) {
  if (command == protocol::commands::VERSION)
    return std::make_unique<VersionMessage>();
  if (command == protocol::commands::VERACK)
    return std::make_unique<VerackMessage>();
  if (command == protocol::commands::PING)
    return std::make_unique<PingMessage>();
  if (command == protocol::commands::PONG)
    return std::make_unique<PongMessage>();
  if (command == protocol::commands::ANNOUNCE)
    return std::make_unique<AnnounceMessage>();
  if (command == protocol::commands::REQUEST)
    return std::make_unique<RequestMessage>();
  if (command == protocol::commands::OBJECT)
    return std::make_unique<ObjectMessage>();
  if (command == protocol::commands::GETPEERS)
    return std::make_unique<GetPeersMessage>();
  if (command == protocol::commands::PEERS)
    return std::make_unique<PeersMessage>();
  return nullptr;
}

std::array<uint8_t, protocol::CHECKSUM_SIZE>
compute_checksum(const std::vector<uint8_t> &payload) {
  auto hash = crypto::Sha256d(payload.data(), payload.size());
  std::array<uint8_t, protocol::CHECKSUM_SIZE> checksum;
  std::memcpy(checksum.data(), hash.data(), protocol::CHECKSUM_SIZE);
  return checksum;
}

protocol::MessageHeader create_header(uint32_t magic, const std::string &command,
                                      const std::vector<uint8_t> &payload) {
  protocol::MessageHeader header(magic, command,
                                 static_cast<uint32_t>(payload.size()));
  header.checksum = compute_checksum(payload);
  return header;
}

std::vector<uint8_t> serialize_header(const protocol::MessageHeader &header) {
  MessageSerializer s;
  s.write_uint32(header.magic);
  s.write_bytes(reinterpret_cast<const uint8_t *>(header.command.data()),
                protocol::COMMAND_SIZE);
  s.write_uint32(header.length);
  s.write_bytes(header.checksum.data(), protocol::CHECKSUM_SIZE);
  return s.release();
}

bool deserialize_header(const uint8_t *data, size_t size,
                        protocol::MessageHeader &header) {
  if (size < protocol::MESSAGE_HEADER_SIZE) {
    return false;
  }

  MessageDeserializer d(data, protocol::MESSAGE_HEADER_SIZE);
  header.magic = d.read_uint32();
  auto cmd = d.read_bytes(protocol::COMMAND_SIZE);
  header.length = d.read_uint32();
  auto checksum = d.read_bytes(protocol::CHECKSUM_SIZE);
  if (d.has_error()) {
    return false;
  }

  std::memcpy(header.command.data(), cmd.data(), protocol::COMMAND_SIZE);
  std::memcpy(header.checksum.data(), checksum.data(), protocol::CHECKSUM_SIZE);

  return header.length <= protocol::MAX_PROTOCOL_MESSAGE_LENGTH;
}

std::vector<uint8_t> frame_message(uint32_t magic, const Message &msg) {
  auto payload = msg.serialize();
  auto header = create_header(magic, msg.command(), payload);
  auto out = serialize_header(header);
  out.reserve(out.size() + payload.size());
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

} // namespace message
} // namespace chaincraft
