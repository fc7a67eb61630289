// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "network/request_handler.hpp"
#include "storage/chain_storage.hpp"
#include "util/logging.hpp"

namespace stakenode {
namespace network {

RequestHandler::RequestHandler(const storage::ChainStorage &storage,
                               size_t branch_history)
    : storage_(storage), branch_history_(branch_history) {}

std::optional<message::CurrentBranchMessage>
RequestHandler::CurrentBranch() const {
  auto branch = storage_.GetCurrentBranch(branch_history_);
  if (!branch) {
    return std::nullopt;
  }
  message::CurrentBranchMessage msg;
  msg.chain_id = storage_.GetChainId();
  msg.branch = std::move(*branch);
  return msg;
}

std::vector<message::BlockHeaderMessage>
RequestHandler::BlockHeaders(
    const message::GetBlockHeadersMessage &request) const {
  std::vector<message::BlockHeaderMessage> replies;
  for (const auto &hash : request.hashes) {
    auto header = storage_.GetHeader(hash);
    if (!header) {
      LOG_NET_TRACE("header {} requested but not stored", hash.ToShortString());
      continue;
    }
    replies.push_back({std::move(*header)});
  }
  return replies;
}

std::vector<message::OperationsForBlocksMessage> RequestHandler::Operations(
    const message::GetOperationsForBlocksMessage &request) const {
  std::vector<message::OperationsForBlocksMessage> replies;
  for (const auto &key : request.keys) {
    auto ops = storage_.GetOperations(key.block_hash, key.pass);
    if (!ops) {
      LOG_NET_TRACE("operations {}/{} requested but not stored",
                    key.block_hash.ToShortString(), key.pass);
      continue;
    }
    replies.push_back({key, std::move(*ops)});
  }
  return replies;
}

} // namespace network
} // namespace stakenode
