// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_NETWORK_MANAGER_HPP
#define STAKENODE_NETWORK_NETWORK_MANAGER_HPP

#include "network/peer.hpp"
#include "network/peer_manager.hpp"
#include "network/replay_log.hpp"
#include "network/request_handler.hpp"
#include "network/transport.hpp"
#include "sync/peer_channel.hpp"
#include "validation/validation_dispatcher.hpp"
#include <atomic>
#include <utility> // boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace stakenode {

namespace storage {
class ChainStorage;
}

namespace sync {
class ChainManager;
}

namespace network {

class BanMan;

/**
 * NetworkManager - event loop, sessions and the chain manager strand
 *
 * Owns the io_context (or borrows one for tests), the transport, the peer
 * registry and the sessions. Session events and dispatcher outcomes are
 * posted to one strand where the chain manager runs, so the chain manager
 * needs no locking. Implements sync::PeerChannel for the chain manager's
 * outbound instructions.
 *
 * Timers:
 *   - chain timer: ChainManager::ProcessTimers every second
 *   - connect timer: dial addresses while below the low-water mark
 *   - maintenance timer: expire bans
 */
class NetworkManager : public sync::PeerChannel {
public:
  struct Config {
    uint16_t listen_port{0};
    bool listen_enabled{true};
    size_t io_threads{4};
    std::vector<std::string> seeds; // host:port
    std::vector<std::string> connect; // dial only these when non-empty
    int64_t ban_duration_sec{24 * 60 * 60};
    std::chrono::seconds connect_interval{5};
    std::chrono::seconds maintenance_interval{60};
    std::chrono::milliseconds chain_timer_interval{1000};
    std::filesystem::path replay_path; // empty = replay disabled
    PeerManager::Config peers;
  };

  NetworkManager(const Config &config,
                 std::shared_ptr<const PeerConfig> peer_config,
                 storage::ChainStorage &storage, BanMan &banman,
                 std::shared_ptr<Transport> transport = nullptr,
                 boost::asio::io_context *external_io_context = nullptr);
  ~NetworkManager() override;

  NetworkManager(const NetworkManager &) = delete;
  NetworkManager &operator=(const NetworkManager &) = delete;

  // Must be set before start(); events are dropped until then
  void attach_chain_manager(sync::ChainManager *chain_manager);

  bool start();
  void stop();
  bool is_running() const { return running_; }

  // Dial host:port; false if malformed or already connected
  bool connect_to(const std::string &address);

  // Run `fn` on the chain manager strand
  void post_to_chain(std::function<void()> fn);

  // Dispatcher ResultHandler target; hops to the chain manager strand
  void post_apply_outcome(const validation::ApplyOutcome &outcome);

  // === sync::PeerChannel ===
  void RequestFetch(sync::PeerId peer,
                    const sync::FetchRequest &request) override;
  void BroadcastBranch(const chain::Branch &branch) override;
  void MarkSynced(sync::PeerId peer) override;
  void MarkBootstrapping(sync::PeerId peer) override;
  void DisconnectPeer(sync::PeerId peer, const std::string &reason,
                      bool ban) override;

  PeerManager &peer_manager() { return peer_manager_; }
  ReplayLog &replay_log() { return replay_log_; }
  boost::asio::io_context &io_context() { return io_context_; }

private:
  void handle_inbound_connection(TransportConnectionPtr connection);
  void setup_peer(const PeerPtr &peer);
  void on_peer_event(sync::PeerEvent event);

  void attempt_outbound_connections();
  void schedule_connect_timer();
  void schedule_chain_timer();
  void schedule_maintenance_timer();

  Config config_;
  std::shared_ptr<const PeerConfig> peer_config_;
  BanMan &banman_;
  RequestHandler requests_;

  std::unique_ptr<boost::asio::io_context> owned_io_context_;
  boost::asio::io_context &io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  boost::asio::strand<boost::asio::io_context::executor_type> chain_strand_;

  std::shared_ptr<Transport> transport_;
  PeerManager peer_manager_;
  ReplayLog replay_log_;
  sync::ChainManager *chain_manager_{nullptr};

  boost::asio::steady_timer connect_timer_;
  boost::asio::steady_timer chain_timer_;
  boost::asio::steady_timer maintenance_timer_;

  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_NETWORK_MANAGER_HPP
