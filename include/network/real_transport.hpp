// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_REAL_TRANSPORT_HPP
#define STAKENODE_NETWORK_REAL_TRANSPORT_HPP

#include "network/transport.hpp"
#include <atomic>
#include <utility> // boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <queue>

namespace stakenode {
namespace network {

/**
 * RealTransportConnection - TCP connection over boost::asio
 *
 * Reads are continuous once start() is called; sends are queued and
 * written one at a time. The queue is bounded by
 * protocol::DEFAULT_SEND_QUEUE_LIMIT; overflowing it drops the peer.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  static std::shared_ptr<RealTransportConnection>
  create_outbound(boost::asio::io_context &io_context,
                  const std::string &address, uint16_t port,
                  ConnectCallback callback);

  static std::shared_ptr<RealTransportConnection>
  create_inbound(boost::asio::io_context &io_context,
                 boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override;

  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  RealTransportConnection(boost::asio::io_context &io_context,
                          bool is_inbound);

  void do_connect(const std::string &address, uint16_t port,
                  ConnectCallback callback);
  void start_read();
  void do_write();
  // close() and then run the saved disconnect callback
  void fail();

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  bool is_inbound_;
  uint64_t id_;
  std::string remote_addr_;
  uint16_t remote_port_{0};
  std::atomic<bool> open_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;
  std::vector<uint8_t> recv_buffer_;

  std::mutex send_mutex_;
  std::queue<std::vector<uint8_t>> send_queue_;
  size_t send_queue_bytes_{0};
  bool writing_{false};

  std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;

  static std::atomic<uint64_t> next_id_;
};

/**
 * RealTransport - TCP transport on a caller-owned io_context
 *
 * The network manager owns the io_context and its threads; run() and
 * stop() only govern the acceptor and the connections created here.
 */
class RealTransport : public Transport {
public:
  explicit RealTransport(boost::asio::io_context &io_context);
  ~RealTransport() override;

  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);
  void track(const std::shared_ptr<RealTransportConnection> &conn);

  boost::asio::io_context &io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  std::atomic<bool> running_{false};

  std::mutex connections_mutex_;
  std::map<uint64_t, std::weak_ptr<RealTransportConnection>> connections_;
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_REAL_TRANSPORT_HPP
