// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_REAL_TRANSPORT_HPP
#define CHAINCRAFT_REAL_TRANSPORT_HPP

#include "network/transport.hpp"
#include <atomic>
#include <utility>  // Boost 1.74 asio/awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace chaincraft {
namespace network {

/**
 * RealTransportConnection - TCP socket implementation of TransportConnection
 *
 * Writes are serialised through a queue capped at
 * protocol::DEFAULT_SEND_QUEUE_SIZE bytes; overflowing it closes the socket.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  static TransportConnectionPtr create_outbound(boost::asio::io_context &io_context,
                                                const std::string &address,
                                                uint16_t port,
                                                ConnectCallback callback);

  static TransportConnectionPtr create_inbound(boost::asio::io_context &io_context,
                                               boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override;

  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override { return open_; }
  size_t pending_sends() const override;
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  RealTransportConnection(boost::asio::io_context &io_context, bool is_inbound);

  void do_connect(const std::string &address, uint16_t port,
                  ConnectCallback callback);
  void start_read();
  void do_write();
  // Close and notify the owner (remote close or I/O error)
  void close_and_notify();

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  bool is_inbound_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;

  mutable std::mutex send_mutex_;
  std::queue<std::vector<uint8_t>> send_queue_;
  size_t send_queue_bytes_{0};
  bool writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 256 * 1024;
  std::vector<uint8_t> recv_buffer_;

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_{0};
};

/**
 * RealTransport - boost::asio implementation of Transport
 *
 * Owns its io_context and io_threads. Socket callbacks run on those threads.
 */
class RealTransport : public Transport {
public:
  explicit RealTransport(size_t io_threads = 2);
  ~RealTransport() override;

  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  boost::asio::io_context &io_context() { return io_context_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  size_t desired_io_threads_;
  std::atomic<bool> running_{false};

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
};

} // namespace network
} // namespace chaincraft

#endif // CHAINCRAFT_REAL_TRANSPORT_HPP
