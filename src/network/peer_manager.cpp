// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/peer_manager.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace stakenode {
namespace network {

PeerManager::PeerManager(const Config &config) : config_(config) {
  if (config_.low_water > config_.high_water) {
    config_.low_water = config_.high_water;
  }
}

sync::PeerId PeerManager::allocate_peer_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_peer_id_++;
}

bool PeerManager::add_peer(const PeerPtr &peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!peer || peers_.count(peer->id())) {
    return false;
  }
  peers_[peer->id()] = peer;
  update_band_locked();
  LOG_NET_TRACE("peer={} registered ({} sessions)", peer->id(), peers_.size());
  return true;
}

void PeerManager::remove_peer(sync::PeerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return;
  }
  const std::string &identity = it->second->identity();
  auto ident = identities_.find(identity);
  if (ident != identities_.end() && ident->second == id) {
    identities_.erase(ident);
  }
  peers_.erase(it);
  update_band_locked();
  LOG_NET_TRACE("peer={} removed ({} sessions)", id, peers_.size());
}

PeerPtr PeerManager::get_peer(sync::PeerId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  return it == peers_.end() ? nullptr : it->second;
}

std::vector<PeerPtr> PeerManager::get_all_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerPtr> result;
  result.reserve(peers_.size());
  for (const auto &[id, peer] : peers_) {
    result.push_back(peer);
  }
  return result;
}

std::vector<PeerPtr> PeerManager::get_established_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerPtr> result;
  for (const auto &[id, peer] : peers_) {
    if (peer->is_established()) {
      result.push_back(peer);
    }
  }
  return result;
}

size_t PeerManager::peer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

size_t PeerManager::inbound_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(peers_.begin(), peers_.end(),
                       [](const auto &p) { return p.second->is_inbound(); });
}

size_t PeerManager::outbound_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(peers_.begin(), peers_.end(),
                       [](const auto &p) { return !p.second->is_inbound(); });
}

void PeerManager::update_band_locked() {
  const size_t count = peers_.size();
  if (!inbound_paused_ && count >= config_.high_water) {
    inbound_paused_ = true;
    LOG_NET_INFO("{} connections, at high-water mark; refusing inbound",
                 count);
  } else if (inbound_paused_ && count <= config_.low_water) {
    inbound_paused_ = false;
    LOG_NET_INFO("{} connections, back at low-water mark; accepting inbound",
                 count);
  }
}

bool PeerManager::admit(const PeerPtr &peer,
                        std::vector<std::string> &alternatives) {
  std::lock_guard<std::mutex> lock(mutex_);

  bool refuse = false;
  auto existing = identities_.find(peer->identity());
  if (existing != identities_.end() && existing->second != peer->id()) {
    LOG_NET_DEBUG("peer={} duplicates identity of peer={}", peer->id(),
                  existing->second);
    refuse = true;
  } else if (peer->is_inbound() && inbound_paused_) {
    LOG_NET_DEBUG("peer={} refused, connection band saturated", peer->id());
    refuse = true;
  } else if (peers_.size() > config_.high_water) {
    LOG_NET_DEBUG("peer={} refused, {} sessions over the high-water mark",
                  peer->id(), peers_.size());
    refuse = true;
  }

  if (refuse) {
    alternatives = alternatives_locked(config_.max_alternatives);
    return false;
  }
  identities_[peer->identity()] = peer->id();
  return true;
}

bool PeerManager::accepting_inbound() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !inbound_paused_;
}

size_t PeerManager::outbound_slots_wanted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size() < config_.low_water ? config_.low_water - peers_.size()
                                           : 0;
}

// ============================================================================
// Address book
// ============================================================================

size_t PeerManager::add_addresses(const std::vector<std::string> &addresses) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t added = 0;
  for (const auto &addr : addresses) {
    std::string host;
    uint16_t port = 0;
    if (addr.size() > protocol::MAX_ADDRESS_LENGTH ||
        !util::SplitHostPort(addr, host, port) || port == 0) {
      LOG_NET_TRACE("ignoring malformed address '{}'", addr);
      continue;
    }
    if (addresses_.size() >= config_.max_addresses) {
      break;
    }
    if (addresses_.emplace(addr, AddressInfo{}).second) {
      ++added;
    }
  }
  if (added > 0) {
    LOG_NET_DEBUG("address book: {} new, {} total", added, addresses_.size());
  }
  return added;
}

bool PeerManager::is_connected_locked(const std::string &address) const {
  for (const auto &[id, peer] : peers_) {
    const std::string target =
        peer->target_address() + ":" + std::to_string(peer->target_port());
    if (target == address) {
      return true;
    }
    if (peer->is_inbound() && peer->remote_listen_port() != 0 &&
        peer->target_address() + ":" +
                std::to_string(peer->remote_listen_port()) ==
            address) {
      return true;
    }
  }
  return false;
}

bool PeerManager::is_connected_to(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return is_connected_locked(address);
}

std::vector<std::string> PeerManager::pick_addresses_to_dial(size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = util::GetSteadyTime();

  std::vector<std::pair<std::string, AddressInfo *>> candidates;
  for (auto &[addr, info] : addresses_) {
    if (is_connected_locked(addr)) {
      continue;
    }
    if (info.attempted && info.failures > 0 &&
        now - info.last_attempt < config_.retry_interval) {
      continue;
    }
    candidates.emplace_back(addr, &info);
  }
  std::sort(candidates.begin(), candidates.end(),
            [](const auto &a, const auto &b) {
              if (a.second->failures != b.second->failures) {
                return a.second->failures < b.second->failures;
              }
              return a.second->last_attempt < b.second->last_attempt;
            });

  std::vector<std::string> picked;
  for (auto &[addr, info] : candidates) {
    if (picked.size() >= count) {
      break;
    }
    info->attempted = true;
    info->last_attempt = now;
    picked.push_back(addr);
  }
  return picked;
}

void PeerManager::mark_dial_failed(const std::string &address) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = addresses_.find(address);
  if (it != addresses_.end()) {
    ++it->second.failures;
  }
}

void PeerManager::mark_dial_succeeded(const std::string &address) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = addresses_.find(address);
  if (it != addresses_.end()) {
    it->second.failures = 0;
  }
}

std::vector<std::string>
PeerManager::alternatives_locked(size_t max) const {
  std::vector<std::string> result;
  for (const auto &[addr, info] : addresses_) {
    if (result.size() >= max) {
      break;
    }
    if (info.failures == 0) {
      result.push_back(addr);
    }
  }
  return result;
}

std::vector<std::string> PeerManager::alternative_peers(size_t max) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return alternatives_locked(max);
}

size_t PeerManager::address_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return addresses_.size();
}

void PeerManager::disconnect_all() {
  std::vector<PeerPtr> peers = get_all_peers();
  for (auto &peer : peers) {
    peer->disconnect(DisconnectReason::SHUTDOWN);
  }
}

} // namespace network
} // namespace stakenode
