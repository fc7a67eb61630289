// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "sync/known_invalid.hpp"

namespace stakenode {
namespace sync {

void KnownInvalidSet::Insert(const uint256 &hash, const std::string &reason,
                             TimePoint now) {
  entries_[hash] = Entry{now + ttl_, reason};
}

bool KnownInvalidSet::Contains(const uint256 &hash) const {
  return entries_.count(hash) > 0;
}

std::string KnownInvalidSet::Reason(const uint256 &hash) const {
  auto it = entries_.find(hash);
  return it == entries_.end() ? std::string() : it->second.reason;
}

size_t KnownInvalidSet::Expire(TimePoint now) {
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires <= now) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

} // namespace sync
} // namespace stakenode
