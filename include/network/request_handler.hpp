// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_NETWORK_REQUEST_HANDLER_HPP
#define STAKENODE_NETWORK_REQUEST_HANDLER_HPP

#include "network/message.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace stakenode {
namespace storage {
class ChainStorage;
}

namespace network {

/**
 * Serves peer requests from local storage. Read-only; safe to call from
 * any session strand.
 *
 * Unknown hashes are skipped rather than answered; the requesting side
 * treats the silence as a timeout.
 */
class RequestHandler {
public:
  RequestHandler(const storage::ChainStorage &storage, size_t branch_history);

  // Local head and its sparse history; nullopt if storage has no head
  std::optional<message::CurrentBranchMessage> CurrentBranch() const;

  std::vector<message::BlockHeaderMessage>
  BlockHeaders(const message::GetBlockHeadersMessage &request) const;

  std::vector<message::OperationsForBlocksMessage>
  Operations(const message::GetOperationsForBlocksMessage &request) const;

private:
  const storage::ChainStorage &storage_;
  size_t branch_history_;
};

} // namespace network
} // namespace stakenode

#endif // STAKENODE_NETWORK_REQUEST_HANDLER_HPP
