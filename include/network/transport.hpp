// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_TRANSPORT_HPP
#define CHAINCRAFT_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chaincraft {
namespace network {

/**
 * Abstract transport interface for network communication
 *
 * Allows dependency injection of different transport implementations:
 * - RealTransport: TCP sockets via boost::asio
 * - SimulatedTransport: in-process hub for multi-node tests
 */

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

using ConnectCallback = std::function<void(bool success)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

/**
 * TransportConnection - a single byte stream to one remote endpoint
 */
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Start delivering received data to the receive callback
  virtual void start() = 0;

  // Queue bytes for sending. False if the connection is closed.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  // Close the connection. Callbacks are not invoked for a local close.
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  // Number of frames queued but not yet handed to the remote side. Peer uses
  // it to bound its outbound backlog.
  virtual size_t pending_sends() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

/**
 * Transport - factory for outbound connections and acceptor for inbound ones
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * Initiate an outbound connection
   *
   * Returns nullptr when the attempt is refused up front. Otherwise callback
   * reports the outcome, possibly before connect() returns.
   */
  virtual TransportConnectionPtr connect(const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) = 0;

  // Start accepting inbound connections on port
  virtual bool listen(uint16_t port, AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;

  // Start the event loop (no-op for synchronous transports)
  virtual void run() = 0;

  // Stop listening and close every connection created by this transport
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace chaincraft

#endif // CHAINCRAFT_TRANSPORT_HPP
