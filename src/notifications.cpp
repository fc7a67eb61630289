// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "notifications.hpp"
#include <algorithm>

namespace stakenode {

// ============================================================================
// ChainNotifications::Subscription
// ============================================================================

ChainNotifications::Subscription::Subscription(ChainNotifications *owner,
                                               size_t id)
    : owner_(owner), id_(id), active_(true) {}

ChainNotifications::Subscription::~Subscription() { Unsubscribe(); }

ChainNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

ChainNotifications::Subscription &
ChainNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void ChainNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// ChainNotifications
// ============================================================================

ChainNotifications::Subscription
ChainNotifications::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entry.id = next_id_++;
  const size_t id = entry.id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

ChainNotifications::Subscription
ChainNotifications::SubscribeHeadAdvanced(HeadAdvancedCallback cb) {
  CallbackEntry entry{};
  entry.head_advanced = std::move(cb);
  return Add(std::move(entry));
}

ChainNotifications::Subscription
ChainNotifications::SubscribeBlockRejected(BlockRejectedCallback cb) {
  CallbackEntry entry{};
  entry.block_rejected = std::move(cb);
  return Add(std::move(entry));
}

ChainNotifications::Subscription
ChainNotifications::SubscribeFatalError(FatalErrorCallback cb) {
  CallbackEntry entry{};
  entry.fatal_error = std::move(cb);
  return Add(std::move(entry));
}

ChainNotifications::Subscription
ChainNotifications::SubscribeSyncState(SyncStateCallback cb) {
  CallbackEntry entry{};
  entry.sync_state = std::move(cb);
  return Add(std::move(entry));
}

void ChainNotifications::NotifyHeadAdvanced(const uint256 &hash,
                                            int32_t level) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : callbacks_) {
    if (entry.head_advanced) {
      entry.head_advanced(hash, level);
    }
  }
}

void ChainNotifications::NotifyBlockRejected(const uint256 &hash,
                                             const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : callbacks_) {
    if (entry.block_rejected) {
      entry.block_rejected(hash, reason);
    }
  }
}

void ChainNotifications::NotifyFatalError(const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : callbacks_) {
    if (entry.fatal_error) {
      entry.fatal_error(reason);
    }
  }
}

void ChainNotifications::NotifySyncState(bool synced) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : callbacks_) {
    if (entry.sync_state) {
      entry.sync_state(synced);
    }
  }
}

ChainNotifications::Subscription
ChainNotifications::SubscribePeerBanned(PeerBannedCallback cb) {
  CallbackEntry entry{};
  entry.peer_banned = std::move(cb);
  return Add(std::move(entry));
}

void ChainNotifications::NotifyPeerBanned(const std::string &identity,
                                          const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : callbacks_) {
    if (entry.peer_banned) {
      entry.peer_banned(identity, reason);
    }
  }
}

void ChainNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(
      callbacks_.begin(), callbacks_.end(),
      [id](const CallbackEntry &entry) { return entry.id == id; });
  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

ChainNotifications &ChainNotifications::Get() {
  static ChainNotifications instance;
  return instance;
}

} // namespace stakenode
