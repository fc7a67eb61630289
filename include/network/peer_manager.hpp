// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_PEER_MANAGER_HPP
#define STAKENODE_NETWORK_PEER_MANAGER_HPP

/*
 PeerManager - connection registry and connection policy

 - Registry of live sessions by id (handshaking and established)
 - Connection band: at high_water new inbound sessions are refused until the
   count falls back to low_water; below low_water outbound dials are wanted
 - Duplicate identities: a second session for an identity that already has
   an admitted session is refused
 - Address book fed by Advertise messages, Nack alternatives and seeds;
   dial candidates are picked by fewest failures, then oldest attempt

 All public methods are thread-safe (mutex_). Sessions call admit() from
 their strand during the handshake.
*/

#include "network/peer.hpp"
#include "sync/peer_events.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace stakenode {
namespace network {

class PeerManager {
public:
  struct Config {
    size_t low_water{protocol::DEFAULT_MIN_CONNECTIONS};
    size_t high_water{protocol::DEFAULT_MAX_CONNECTIONS};
    size_t max_addresses{1000};
    size_t max_alternatives{10};
    // A failed address is not retried before this much time has passed
    std::chrono::seconds retry_interval{60};
  };

  PeerManager() : PeerManager(Config{}) {}
  explicit PeerManager(const Config &config);

  sync::PeerId allocate_peer_id();

  // Register a session (before its handshake); false if the id is taken
  bool add_peer(const PeerPtr &peer);
  void remove_peer(sync::PeerId id);
  PeerPtr get_peer(sync::PeerId id) const;

  std::vector<PeerPtr> get_all_peers() const;
  std::vector<PeerPtr> get_established_peers() const;

  size_t peer_count() const;
  size_t inbound_count() const;
  size_t outbound_count() const;

  /**
   * Admission decision at the end of the handshake. Refuses duplicates and
   * sessions beyond the connection band; on refusal `alternatives` gets
   * addresses the peer may try instead.
   */
  bool admit(const PeerPtr &peer, std::vector<std::string> &alternatives);

  // False while the band is saturated (hysteresis between the marks)
  bool accepting_inbound() const;
  // Outbound dials needed to reach low_water
  size_t outbound_slots_wanted() const;

  // === Address book ===
  size_t add_addresses(const std::vector<std::string> &addresses);
  std::vector<std::string> pick_addresses_to_dial(size_t count);
  void mark_dial_failed(const std::string &address);
  void mark_dial_succeeded(const std::string &address);
  std::vector<std::string> alternative_peers(size_t max) const;
  size_t address_count() const;
  bool is_connected_to(const std::string &address) const;

  // Close every session (shutdown)
  void disconnect_all();

private:
  struct AddressInfo {
    uint32_t failures{0};
    std::chrono::steady_clock::time_point last_attempt{};
    bool attempted{false};
  };

  void update_band_locked();
  std::vector<std::string> alternatives_locked(size_t max) const;
  bool is_connected_locked(const std::string &address) const;

  Config config_;
  mutable std::mutex mutex_;
  sync::PeerId next_peer_id_{1};
  std::map<sync::PeerId, PeerPtr> peers_;
  std::map<std::string, sync::PeerId> identities_; // admitted sessions
  std::map<std::string, AddressInfo> addresses_;
  bool inbound_paused_{false};
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_PEER_MANAGER_HPP
