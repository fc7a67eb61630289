// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_TRANSPORT_HPP
#define STAKENODE_NETWORK_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace stakenode {
namespace network {

/**
 * Byte-stream transport seam
 *
 * - RealTransport: TCP sockets via boost::asio
 * - SimulatedTransport: in-memory delivery for tests
 *
 * Sessions see only TransportConnection; framing and encryption live
 * above it.
 */

class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

using ConnectCallback = std::function<void(bool success)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Begin delivering received bytes to the receive callback
  virtual void start() = 0;

  // Queue bytes; false if the connection is closed or its queue is full
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

class Transport {
public:
  virtual ~Transport() = default;

  // The returned connection may not be open until `callback(true)`
  virtual TransportConnectionPtr connect(const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) = 0;

  virtual bool listen(uint16_t port, AcceptCallback accept_callback) = 0;
  virtual void stop_listening() = 0;

  virtual void run() = 0;
  // Closes every connection and stops listening
  virtual void stop() = 0;
  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_TRANSPORT_HPP
