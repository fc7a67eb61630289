// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "validation/sandbox_engine.hpp"
#include "crypto/hash.hpp"
#include "util/logging.hpp"

namespace stakenode {
namespace validation {

uint256 SandboxEngine::ComputeContext(const uint256 &predecessor_context,
                                      const uint256 &block_hash) {
  crypto::HashWriter hw;
  hw.Write(predecessor_context).Write(block_hash);
  return hw.GetHash();
}

bool SandboxEngine::ApplyBlock(const ApplyRequest &request,
                               ApplyResult &result, ValidationState &state) {
  const auto &header = request.header;
  if (request.operations.size() != header.validation_passes ||
      header.operations_hashes.size() != header.validation_passes) {
    return state.Invalid("bad-validation-passes");
  }

  result.operation_results.clear();
  for (size_t pass = 0; pass < request.operations.size(); ++pass) {
    const auto &ops = request.operations[pass];
    if (chain::ComputeOperationsListHash(ops) !=
        header.operations_hashes[pass]) {
      return state.Invalid("bad-operations-hash",
                           "pass " + std::to_string(pass));
    }
    for (const auto &op : ops) {
      if (op.data.empty()) {
        return state.Invalid("empty-operation",
                             "operation " + op.GetHash().ToShortString());
      }
      result.operation_results.push_back("applied");
    }
  }

  result.context_hash =
      ComputeContext(request.predecessor_context, header.GetHash());
  return true;
}

bool SandboxEngine::CollectGarbage(ValidationState &) {
  ++gc_requests_;
  LOG_CHAIN_TRACE("sandbox engine: collect garbage (#{})", gc_requests_.load());
  return true;
}

} // namespace validation
} // namespace stakenode
