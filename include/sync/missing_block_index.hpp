// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_SYNC_MISSING_BLOCK_INDEX_HPP
#define STAKENODE_SYNC_MISSING_BLOCK_INDEX_HPP

#include "sync/peer_events.hpp"
#include "util/uint.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace stakenode {
namespace sync {

struct MissingEntry {
  int32_t level_hint{0};
  // Lowest level the locate-ancestor walk may reach through this entry
  int32_t lookback_floor{0};
  std::set<PeerId> advertisers;
  std::set<PeerId> tried;
  std::optional<PeerId> in_flight;
  std::chrono::steady_clock::time_point requested_at{};
  // Operations index only: passes not yet stored
  std::set<uint8_t> pending_passes;
  uint8_t in_flight_pass{0};
};

/**
 * MissingBlockIndex - blocks (or block operations) we need, who can
 * serve them, and who is currently asked.
 *
 * A hash appears at most once and has at most one in-flight peer. The
 * chain manager keeps two instances, one for headers and one for
 * operations.
 *
 * Not thread-safe; owned by the chain manager strand.
 */
class MissingBlockIndex {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using CapacityCheck = std::function<bool(PeerId)>;

  explicit MissingBlockIndex(size_t capacity);

  // False when the index is full and the hash is not already tracked
  bool Add(const uint256 &hash, int32_t level_hint, int32_t lookback_floor);
  void AddAdvertiser(const uint256 &hash, PeerId peer);

  bool Contains(const uint256 &hash) const;
  MissingEntry *Get(const uint256 &hash);
  const MissingEntry *Get(const uint256 &hash) const;
  void Remove(const uint256 &hash);

  /**
   * Choose the advertiser to ask next: not tried, passing `has_capacity`,
   * least recently assigned first. nullopt if the entry is in flight or
   * no candidate remains.
   */
  std::optional<PeerId> PickCandidate(const uint256 &hash,
                                      const CapacityCheck &has_capacity) const;

  void MarkInFlight(const uint256 &hash, PeerId peer, TimePoint now,
                    uint8_t pass = 0);

  // Clear the in-flight slot; optionally never ask that peer again
  std::optional<PeerId> Release(const uint256 &hash, bool mark_tried);

  /**
   * Forget a peer entirely (disconnect). Returns the hashes whose
   * in-flight request was held by it.
   */
  std::vector<uint256> RemovePeer(PeerId peer);

  // New branch from this peer: it may be asked again
  void ClearTried(PeerId peer);

  std::vector<uint256> TimedOut(TimePoint now,
                                std::chrono::milliseconds timeout) const;
  std::vector<uint256> Unassigned() const;
  std::vector<uint256> Hashes() const;

  size_t Size() const { return entries_.size(); }
  size_t Capacity() const { return capacity_; }
  size_t InFlightCount() const;
  size_t InFlightFor(PeerId peer) const;

private:
  size_t capacity_;
  std::unordered_map<uint256, MissingEntry, Uint256Hasher> entries_;
  // Assignment sequence number per peer, for least-recently-assigned choice
  std::map<PeerId, uint64_t> last_assigned_;
  uint64_t assign_seq_{0};
};

} // namespace sync
} // namespace stakenode

#endif // STAKENODE_SYNC_MISSING_BLOCK_INDEX_HPP
