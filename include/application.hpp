// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_APPLICATION_HPP
#define STAKENODE_APPLICATION_HPP

#include "chain/chainparams.hpp"
#include "crypto/identity.hpp"
#include "network/banman.hpp"
#include "network/network_manager.hpp"
#include "node_config.hpp"
#include "notifications.hpp"
#include "storage/chain_storage.hpp"
#include "storage/kv_store.hpp"
#include "sync/chain_manager.hpp"
#include "validation/engine_handle.hpp"
#include "validation/validation_dispatcher.hpp"
#include <atomic>
#include <csignal>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace stakenode {
namespace app {

/**
 * Application - owns and wires the node components
 *
 * Startup order: data directory lock, chain parameters, node identity,
 * chain storage, validation engine and dispatcher, ban list, network, chain
 * manager. Shutdown runs in reverse: the network stops first so no further
 * events reach the chain manager, then the dispatcher drains its running
 * job.
 *
 * A fatal-error notification (storage failure, engine restarts exhausted)
 * requests shutdown; the process then exits non-zero.
 */
class Application {
public:
  explicit Application(const NodeConfig &config);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Build every component; false leaves the application unusable
  bool initialize();

  bool start();
  void stop();

  // Block until SIGINT/SIGTERM or a fatal error, then shut down
  void wait_for_shutdown();

  void request_shutdown() { shutdown_requested_ = true; }
  bool is_running() const { return running_; }

  // Set once a fatal error was published
  bool failed() const { return fatal_; }
  std::string failure_reason() const;

  static Application *instance();

  const NodeConfig &config() const { return config_; }
  const chain::ChainParams &chain_params() const { return *chain_params_; }
  network::NetworkManager &network_manager() { return *network_manager_; }
  storage::ChainStorage &chain_storage() { return *storage_; }

private:
  bool init_datadir();
  bool init_chain_params();
  bool init_identity();
  bool init_storage();
  bool init_validation();
  bool init_network();
  bool init_chain_manager();

  void shutdown();

  void setup_signal_handlers();
  static void signal_handler(int signal);

  static Application *instance_;

  NodeConfig config_;
  std::unique_ptr<chain::ChainParams> chain_params_;
  std::optional<crypto::NodeIdentity> identity_;

  // Declaration order is destruction order in reverse: the chain manager
  // goes first, the store last
  std::unique_ptr<storage::KeyValueStore> store_;
  std::unique_ptr<storage::ChainStorage> storage_;
  std::unique_ptr<validation::EngineHandle> engine_;
  std::unique_ptr<network::BanMan> banman_;
  std::unique_ptr<network::NetworkManager> network_manager_;
  std::unique_ptr<validation::ValidationDispatcher> dispatcher_;
  std::unique_ptr<sync::ChainManager> chain_manager_;

  ChainNotifications::Subscription fatal_sub_;
  ChainNotifications::Subscription head_sub_;
  ChainNotifications::Subscription banned_sub_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> fatal_{false};
  mutable std::mutex fatal_mutex_;
  std::string fatal_reason_;
  bool datadir_locked_{false};
};

} // namespace app
} // namespace stakenode

#endif // STAKENODE_APPLICATION_HPP
