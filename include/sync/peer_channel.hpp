// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_SYNC_PEER_CHANNEL_HPP
#define STAKENODE_SYNC_PEER_CHANNEL_HPP

#include "chain/block.hpp"
#include "sync/peer_events.hpp"
#include <string>

namespace stakenode {
namespace sync {

/**
 * PeerChannel - the chain manager's only way to act on peer sessions
 *
 * Every call is a message: implementations post it to the session's
 * strand and return immediately. Calls naming an unknown peer are
 * ignored.
 */
class PeerChannel {
public:
  virtual ~PeerChannel() = default;

  virtual void RequestFetch(PeerId peer, const FetchRequest &request) = 0;

  // Advertise our new head to every established session
  virtual void BroadcastBranch(const chain::Branch &branch) = 0;

  // The peer's advertised branch is reconciled with local state
  virtual void MarkSynced(PeerId peer) = 0;

  // A newer branch from the peer is not reconciled yet
  virtual void MarkBootstrapping(PeerId peer) = 0;

  virtual void DisconnectPeer(PeerId peer, const std::string &reason,
                              bool ban) = 0;
};

} // namespace sync
} // namespace stakenode

#endif // STAKENODE_SYNC_PEER_CHANNEL_HPP
