// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/network_manager.hpp"
#include "network/banman.hpp"
#include "network/real_transport.hpp"
#include "notifications.hpp"
#include "storage/chain_storage.hpp"
#include "sync/chain_manager.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "util/time.hpp"

namespace stakenode {
namespace network {

static boost::asio::io_context &
pick_io_context(std::unique_ptr<boost::asio::io_context> &owned,
                boost::asio::io_context *external) {
  if (external) {
    return *external;
  }
  owned = std::make_unique<boost::asio::io_context>();
  return *owned;
}

NetworkManager::NetworkManager(const Config &config,
                               std::shared_ptr<const PeerConfig> peer_config,
                               storage::ChainStorage &storage, BanMan &banman,
                               std::shared_ptr<Transport> transport,
                               boost::asio::io_context *external_io_context)
    : config_(config), peer_config_(std::move(peer_config)), banman_(banman),
      requests_(storage, chain::MAX_BRANCH_HISTORY),
      io_context_(pick_io_context(owned_io_context_, external_io_context)),
      chain_strand_(boost::asio::make_strand(io_context_)),
      transport_(std::move(transport)), peer_manager_(config.peers),
      connect_timer_(io_context_), chain_timer_(chain_strand_),
      maintenance_timer_(io_context_) {
  if (!transport_) {
    transport_ = std::make_shared<RealTransport>(io_context_);
  }
}

NetworkManager::~NetworkManager() { stop(); }

void NetworkManager::attach_chain_manager(sync::ChainManager *chain_manager) {
  chain_manager_ = chain_manager;
}

bool NetworkManager::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  running_.store(true, std::memory_order_release);

  if (!config_.replay_path.empty() && !replay_log_.Open(config_.replay_path)) {
    LOG_NET_WARN("replay recording disabled");
  }

  transport_->run();

  if (config_.listen_enabled && config_.listen_port > 0) {
    bool success = transport_->listen(
        config_.listen_port, [this](TransportConnectionPtr connection) {
          handle_inbound_connection(std::move(connection));
        });
    if (!success) {
      LOG_NET_ERROR("failed to start listener on port {}", config_.listen_port);
    }
  }

  if (config_.connect.empty()) {
    peer_manager_.add_addresses(config_.seeds);
  } else {
    peer_manager_.add_addresses(config_.connect);
  }

  schedule_chain_timer();
  schedule_connect_timer();
  schedule_maintenance_timer();
  boost::asio::post(io_context_, [this]() { attempt_outbound_connections(); });

  // With an external io_context (tests) the caller drives the loop
  if (owned_io_context_ && config_.io_threads > 0) {
    work_guard_ = std::make_unique<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_.run(); });
    }
  }

  LOG_NET_INFO("network started ({} io threads, listening: {})",
               io_threads_.size(),
               config_.listen_enabled && config_.listen_port > 0);
  return true;
}

void NetworkManager::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.exchange(false)) {
    return;
  }
  LOG_NET_INFO("stopping network");

  connect_timer_.cancel();
  chain_timer_.cancel();
  maintenance_timer_.cancel();

  peer_manager_.disconnect_all();
  transport_->stop();

  work_guard_.reset();
  if (!io_threads_.empty()) {
    // Let queued session closes drain before the loop stops
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    io_context_.stop();
    for (auto &thread : io_threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    io_threads_.clear();
  }
  replay_log_.Close();
}

// ============================================================================
// Connections
// ============================================================================

bool NetworkManager::connect_to(const std::string &address) {
  if (!running_.load(std::memory_order_acquire)) {
    return false;
  }

  std::string host;
  uint16_t port = 0;
  if (!util::SplitHostPort(address, host, port) || port == 0) {
    LOG_NET_DEBUG("cannot dial malformed address '{}'", address);
    return false;
  }
  if (peer_manager_.is_connected_to(address)) {
    LOG_NET_TRACE("already connected to {}, skipping", address);
    return false;
  }

  // The simulated transport reports success before connect() returns, so
  // the session is handed to the callback through a holder
  auto holder = std::make_shared<PeerPtr>();
  auto connection = transport_->connect(
      host, port, [this, holder, address](bool success) {
        boost::asio::post(io_context_, [this, holder, address, success]() {
          PeerPtr peer = *holder;
          if (!peer) {
            return;
          }
          if (success && running_) {
            peer_manager_.mark_dial_succeeded(address);
            peer->start();
          } else {
            LOG_NET_DEBUG("failed to connect to {}", address);
            peer_manager_.mark_dial_failed(address);
            peer->disconnect(DisconnectReason::TRANSPORT_CLOSED);
          }
        });
      });
  if (!connection) {
    LOG_NET_ERROR("failed to create connection to {}", address);
    return false;
  }

  auto peer = Peer::create_outbound(io_context_, connection, peer_config_,
                                    &requests_, host, port);
  peer->set_id(peer_manager_.allocate_peer_id());
  setup_peer(peer);
  peer_manager_.add_peer(peer);
  *holder = peer;
  LOG_NET_DEBUG("dialing {} as peer={}", address, peer->id());
  return true;
}

void NetworkManager::handle_inbound_connection(
    TransportConnectionPtr connection) {
  if (!running_ || !connection) {
    if (connection) {
      connection->close();
    }
    return;
  }

  // Far beyond the band: drop without a handshake. Inside the band the
  // handshake runs and admission answers with a Nack.
  if (peer_manager_.peer_count() >= 2 * config_.peers.high_water) {
    LOG_NET_DEBUG("dropping inbound {}:{}, {} sessions",
                  connection->remote_address(), connection->remote_port(),
                  peer_manager_.peer_count());
    connection->close();
    return;
  }

  auto peer =
      Peer::create_inbound(io_context_, connection, peer_config_, &requests_);
  peer->set_id(peer_manager_.allocate_peer_id());
  setup_peer(peer);
  peer_manager_.add_peer(peer);
  LOG_NET_DEBUG("inbound connection from {}:{} as peer={}", peer->address(),
                peer->port(), peer->id());
  peer->start();
}

void NetworkManager::setup_peer(const PeerPtr &peer) {
  PeerCallbacks callbacks;
  callbacks.on_event = [this](sync::PeerEvent event) {
    on_peer_event(std::move(event));
  };
  callbacks.admit = [this](const PeerPtr &p,
                           std::vector<std::string> &alternatives) {
    return peer_manager_.admit(p, alternatives);
  };
  callbacks.is_banned = [this](const std::string &identity) {
    return banman_.IsBanned(identity);
  };
  callbacks.on_addresses = [this](const std::vector<std::string> &addresses) {
    peer_manager_.add_addresses(addresses);
  };
  if (!config_.replay_path.empty()) {
    callbacks.on_replay = [this](const Peer &p, const char *kind,
                                 const std::vector<uint8_t> &payload) {
      replay_log_.Record(
          {util::GetTime(), p.id(), p.identity(), kind, payload});
    };
  }
  callbacks.on_closed = [this](const PeerPtr &p) {
    peer_manager_.remove_peer(p->id());
  };
  peer->set_callbacks(std::move(callbacks));
}

void NetworkManager::on_peer_event(sync::PeerEvent event) {
  boost::asio::post(chain_strand_, [this, event = std::move(event)]() {
    if (!chain_manager_) {
      return;
    }
    try {
      chain_manager_->HandleEvent(event);
    } catch (const std::exception &e) {
      LOG_CHAIN_CRITICAL("chain manager failed handling event: {}", e.what());
      Notifications().NotifyFatalError(std::string("chain-manager: ") +
                                       e.what());
    }
  });
}

void NetworkManager::post_to_chain(std::function<void()> fn) {
  boost::asio::post(chain_strand_, std::move(fn));
}

void NetworkManager::post_apply_outcome(
    const validation::ApplyOutcome &outcome) {
  boost::asio::post(chain_strand_, [this, outcome]() {
    if (chain_manager_) {
      chain_manager_->OnApplyOutcome(outcome);
    }
  });
}

// ============================================================================
// sync::PeerChannel
// ============================================================================

void NetworkManager::RequestFetch(sync::PeerId peer,
                                  const sync::FetchRequest &request) {
  if (auto session = peer_manager_.get_peer(peer)) {
    session->request_fetch(request);
  } else {
    LOG_NET_TRACE("fetch for unknown peer={} dropped", peer);
  }
}

void NetworkManager::BroadcastBranch(const chain::Branch &branch) {
  for (const auto &session : peer_manager_.get_established_peers()) {
    session->send_branch(branch);
  }
}

void NetworkManager::MarkSynced(sync::PeerId peer) {
  if (auto session = peer_manager_.get_peer(peer)) {
    session->mark_synced();
  }
}

void NetworkManager::MarkBootstrapping(sync::PeerId peer) {
  if (auto session = peer_manager_.get_peer(peer)) {
    session->mark_bootstrapping();
  }
}

void NetworkManager::DisconnectPeer(sync::PeerId peer,
                                    const std::string &reason, bool ban) {
  auto session = peer_manager_.get_peer(peer);
  if (!session) {
    return;
  }
  if (ban && !session->identity().empty()) {
    banman_.Ban(session->identity(), config_.ban_duration_sec, reason);
    Notifications().NotifyPeerBanned(session->identity(), reason);
    LOG_NET_INFO("banned peer={} ({}) for {}s: {}", peer,
                 session->identity().substr(0, 16), config_.ban_duration_sec,
                 reason);
  }
  session->disconnect(ban ? DisconnectReason::BANNED
                          : DisconnectReason::PROTOCOL_VIOLATION,
                      ban);
}

// ============================================================================
// Timers
// ============================================================================

void NetworkManager::attempt_outbound_connections() {
  if (!running_) {
    return;
  }
  const size_t wanted = peer_manager_.outbound_slots_wanted();
  if (wanted == 0) {
    return;
  }
  for (const auto &address : peer_manager_.pick_addresses_to_dial(wanted)) {
    connect_to(address);
  }
}

void NetworkManager::schedule_connect_timer() {
  connect_timer_.expires_after(config_.connect_interval);
  connect_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_) {
      return;
    }
    attempt_outbound_connections();
    schedule_connect_timer();
  });
}

void NetworkManager::schedule_chain_timer() {
  chain_timer_.expires_after(config_.chain_timer_interval);
  chain_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_) {
      return;
    }
    if (chain_manager_) {
      chain_manager_->ProcessTimers(util::GetSteadyTime());
    }
    schedule_chain_timer();
  });
}

void NetworkManager::schedule_maintenance_timer() {
  maintenance_timer_.expires_after(config_.maintenance_interval);
  maintenance_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_) {
      return;
    }
    banman_.SweepBanned();
    LOG_NET_DEBUG("{} sessions ({} inbound, {} outbound), {} known addresses",
                  peer_manager_.peer_count(), peer_manager_.inbound_count(),
                  peer_manager_.outbound_count(),
                  peer_manager_.address_count());
    schedule_maintenance_timer();
  });
}

} // namespace network
} // namespace stakenode
