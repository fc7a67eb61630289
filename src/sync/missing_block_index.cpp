// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "sync/missing_block_index.hpp"
#include <algorithm>

namespace stakenode {
namespace sync {

MissingBlockIndex::MissingBlockIndex(size_t capacity) : capacity_(capacity) {}

bool MissingBlockIndex::Add(const uint256 &hash, int32_t level_hint,
                            int32_t lookback_floor) {
  auto it = entries_.find(hash);
  if (it != entries_.end()) {
    // Keep the most permissive floor any advertisement allowed
    it->second.lookback_floor =
        std::min(it->second.lookback_floor, lookback_floor);
    return true;
  }
  if (entries_.size() >= capacity_) {
    return false;
  }
  MissingEntry entry;
  entry.level_hint = level_hint;
  entry.lookback_floor = lookback_floor;
  entries_.emplace(hash, std::move(entry));
  return true;
}

void MissingBlockIndex::AddAdvertiser(const uint256 &hash, PeerId peer) {
  auto it = entries_.find(hash);
  if (it != entries_.end()) {
    it->second.advertisers.insert(peer);
  }
}

bool MissingBlockIndex::Contains(const uint256 &hash) const {
  return entries_.count(hash) > 0;
}

MissingEntry *MissingBlockIndex::Get(const uint256 &hash) {
  auto it = entries_.find(hash);
  return it == entries_.end() ? nullptr : &it->second;
}

const MissingEntry *MissingBlockIndex::Get(const uint256 &hash) const {
  auto it = entries_.find(hash);
  return it == entries_.end() ? nullptr : &it->second;
}

void MissingBlockIndex::Remove(const uint256 &hash) { entries_.erase(hash); }

std::optional<PeerId>
MissingBlockIndex::PickCandidate(const uint256 &hash,
                                 const CapacityCheck &has_capacity) const {
  auto it = entries_.find(hash);
  if (it == entries_.end() || it->second.in_flight) {
    return std::nullopt;
  }

  std::optional<PeerId> best;
  uint64_t best_seq = 0;
  for (PeerId peer : it->second.advertisers) {
    if (it->second.tried.count(peer)) {
      continue;
    }
    if (has_capacity && !has_capacity(peer)) {
      continue;
    }
    auto seq_it = last_assigned_.find(peer);
    uint64_t seq = seq_it == last_assigned_.end() ? 0 : seq_it->second;
    if (!best || seq < best_seq) {
      best = peer;
      best_seq = seq;
    }
  }
  return best;
}

void MissingBlockIndex::MarkInFlight(const uint256 &hash, PeerId peer,
                                     TimePoint now, uint8_t pass) {
  auto it = entries_.find(hash);
  if (it == entries_.end()) {
    return;
  }
  it->second.in_flight = peer;
  it->second.in_flight_pass = pass;
  it->second.requested_at = now;
  last_assigned_[peer] = ++assign_seq_;
}

std::optional<PeerId> MissingBlockIndex::Release(const uint256 &hash,
                                                 bool mark_tried) {
  auto it = entries_.find(hash);
  if (it == entries_.end() || !it->second.in_flight) {
    return std::nullopt;
  }
  PeerId peer = *it->second.in_flight;
  it->second.in_flight.reset();
  if (mark_tried) {
    it->second.tried.insert(peer);
  }
  return peer;
}

std::vector<uint256> MissingBlockIndex::RemovePeer(PeerId peer) {
  std::vector<uint256> released;
  for (auto &[hash, entry] : entries_) {
    entry.advertisers.erase(peer);
    entry.tried.erase(peer);
    if (entry.in_flight && *entry.in_flight == peer) {
      entry.in_flight.reset();
      released.push_back(hash);
    }
  }
  last_assigned_.erase(peer);
  return released;
}

void MissingBlockIndex::ClearTried(PeerId peer) {
  for (auto &[hash, entry] : entries_) {
    entry.tried.erase(peer);
  }
}

std::vector<uint256>
MissingBlockIndex::TimedOut(TimePoint now,
                            std::chrono::milliseconds timeout) const {
  std::vector<uint256> expired;
  for (const auto &[hash, entry] : entries_) {
    if (entry.in_flight && now - entry.requested_at >= timeout) {
      expired.push_back(hash);
    }
  }
  return expired;
}

std::vector<uint256> MissingBlockIndex::Unassigned() const {
  std::vector<uint256> out;
  for (const auto &[hash, entry] : entries_) {
    if (!entry.in_flight) {
      out.push_back(hash);
    }
  }
  return out;
}

std::vector<uint256> MissingBlockIndex::Hashes() const {
  std::vector<uint256> out;
  out.reserve(entries_.size());
  for (const auto &[hash, entry] : entries_) {
    out.push_back(hash);
  }
  return out;
}

size_t MissingBlockIndex::InFlightCount() const {
  return std::count_if(entries_.begin(), entries_.end(), [](const auto &kv) {
    return kv.second.in_flight.has_value();
  });
}

size_t MissingBlockIndex::InFlightFor(PeerId peer) const {
  return std::count_if(entries_.begin(), entries_.end(),
                       [peer](const auto &kv) {
                         return kv.second.in_flight &&
                                *kv.second.in_flight == peer;
                       });
}

} // namespace sync
} // namespace stakenode
