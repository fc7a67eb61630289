// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NOTIFICATIONS_HPP
#define STAKENODE_NOTIFICATIONS_HPP

#include "util/uint.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace stakenode {

/**
 * ChainNotifications - process-wide observer hub for chain events
 *
 * Subscribers get an RAII Subscription; dropping it unsubscribes.
 * Callbacks run on the thread that raised the event (a dispatcher
 * worker for head/reject/fatal, the sync strand for sync state and bans)
 * and must not block.
 */
class ChainNotifications {
public:
  using HeadAdvancedCallback =
      std::function<void(const uint256 &hash, int32_t level)>;
  using BlockRejectedCallback =
      std::function<void(const uint256 &hash, const std::string &reason)>;
  using FatalErrorCallback = std::function<void(const std::string &reason)>;
  using SyncStateCallback = std::function<void(bool synced)>;
  using PeerBannedCallback = std::function<void(const std::string &identity,
                                                const std::string &reason)>;

  class Subscription {
  public:
    Subscription() = default;
    Subscription(ChainNotifications *owner, size_t id);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    void Unsubscribe();

  private:
    ChainNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  [[nodiscard]] Subscription SubscribeHeadAdvanced(HeadAdvancedCallback cb);
  [[nodiscard]] Subscription SubscribeBlockRejected(BlockRejectedCallback cb);
  [[nodiscard]] Subscription SubscribeFatalError(FatalErrorCallback cb);
  [[nodiscard]] Subscription SubscribeSyncState(SyncStateCallback cb);
  [[nodiscard]] Subscription SubscribePeerBanned(PeerBannedCallback cb);

  void NotifyHeadAdvanced(const uint256 &hash, int32_t level);
  void NotifyBlockRejected(const uint256 &hash, const std::string &reason);
  void NotifyFatalError(const std::string &reason);
  void NotifySyncState(bool synced);
  void NotifyPeerBanned(const std::string &identity, const std::string &reason);

  static ChainNotifications &Get();

private:
  struct CallbackEntry {
    size_t id;
    HeadAdvancedCallback head_advanced;
    BlockRejectedCallback block_rejected;
    FatalErrorCallback fatal_error;
    SyncStateCallback sync_state;
    PeerBannedCallback peer_banned;
  };

  Subscription Add(CallbackEntry entry);
  void Unsubscribe(size_t id);

  std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};
};

inline ChainNotifications &Notifications() { return ChainNotifications::Get(); }

} // namespace stakenode

#endif // STAKENODE_NOTIFICATIONS_HPP
