// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_SYNC_KNOWN_INVALID_HPP
#define STAKENODE_SYNC_KNOWN_INVALID_HPP

#include "util/uint.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

namespace stakenode {
namespace sync {

/**
 * Blocks that failed validation or structural checks. While an entry is
 * live the block is neither re-requested nor re-validated.
 */
class KnownInvalidSet {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  explicit KnownInvalidSet(std::chrono::seconds ttl) : ttl_(ttl) {}

  void Insert(const uint256 &hash, const std::string &reason, TimePoint now);
  bool Contains(const uint256 &hash) const;
  std::string Reason(const uint256 &hash) const;

  // Drop entries whose cool-down has elapsed; returns how many
  size_t Expire(TimePoint now);

  size_t Size() const { return entries_.size(); }

private:
  struct Entry {
    TimePoint expires;
    std::string reason;
  };

  std::chrono::seconds ttl_;
  std::unordered_map<uint256, Entry, Uint256Hasher> entries_;
};

} // namespace sync
} // namespace stakenode

#endif // STAKENODE_SYNC_KNOWN_INVALID_HPP
