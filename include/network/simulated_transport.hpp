// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_SIMULATED_TRANSPORT_HPP
#define STAKENODE_NETWORK_SIMULATED_TRANSPORT_HPP

#include "network/transport.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace stakenode {
namespace network {

class SimulatedTransport;

/**
 * SimulatedTransportConnection - in-memory connection for tests
 *
 * send() hands bytes to the owning SimulatedTransport, which delivers
 * them to the linked connection when simulated time reaches their
 * delivery time.
 */
class SimulatedTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<SimulatedTransportConnection> {
public:
  SimulatedTransportConnection(uint64_t id, bool is_inbound,
                               const std::string &remote_addr,
                               uint16_t remote_port,
                               SimulatedTransport *transport);
  ~SimulatedTransportConnection() override;

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

  // Called by SimulatedTransport
  void deliver_data(const std::vector<uint8_t> &data);
  void remote_closed();

  void set_peer_connection(std::weak_ptr<SimulatedTransportConnection> peer);
  std::weak_ptr<SimulatedTransportConnection> get_peer_connection() const {
    return peer_connection_;
  }

private:
  uint64_t id_;
  bool is_inbound_;
  std::string remote_addr_;
  uint16_t remote_port_;
  SimulatedTransport *transport_;
  std::atomic<bool> open_{true};

  std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;

  std::weak_ptr<SimulatedTransportConnection> peer_connection_;
};

/**
 * SimulatedTransport - in-memory transport for tests
 *
 * Any number of listeners, each on its own port. Nothing is delivered
 * until the test advances simulated time (advance_time(0) delivers what
 * is already due).
 */
class SimulatedTransport : public Transport {
public:
  SimulatedTransport();
  ~SimulatedTransport() override;

  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  struct NetworkConditions {
    uint64_t latency_ms = 0;
  };

  void set_network_conditions(const NetworkConditions &conditions);
  // Deliver everything due by now + ms; returns the number delivered
  size_t advance_time(uint64_t ms);
  uint64_t get_current_time() const { return current_time_ms_; }
  size_t pending_count() const;

  // Called by connections
  void route_message(uint64_t from_conn_id, const std::vector<uint8_t> &data);
  void route_close(uint64_t from_conn_id);

private:
  struct PendingMessage {
    uint64_t delivery_time_ms;
    uint64_t to_conn_id;
    std::vector<uint8_t> data;
    bool close{false};
  };

  std::shared_ptr<SimulatedTransportConnection> find(uint64_t id);
  void enqueue(uint64_t from_conn_id, std::vector<uint8_t> data, bool close);

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> current_time_ms_{0};
  NetworkConditions conditions_;

  std::mutex listeners_mutex_;
  std::map<uint16_t, AcceptCallback> listeners_;

  std::mutex connections_mutex_;
  std::map<uint64_t, std::weak_ptr<SimulatedTransportConnection>> connections_;
  std::atomic<uint64_t> next_connection_id_{1};

  mutable std::mutex messages_mutex_;
  std::deque<PendingMessage> pending_messages_;
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_SIMULATED_TRANSPORT_HPP
