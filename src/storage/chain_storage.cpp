// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "storage/chain_storage.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include "util/serialize.hpp"
#include <algorithm>

namespace stakenode {
namespace storage {

namespace {

constexpr char PREFIX_BLOCK = 'B';
constexpr char PREFIX_OPERATIONS = 'O';
constexpr char PREFIX_STATE = 'S';
constexpr char PREFIX_CONTEXT = 'C';
constexpr char PREFIX_LEVEL = 'L';
constexpr char PREFIX_PRUNED = 'P';

constexpr uint8_t BLOCK_RECORD_VERSION = 1;
constexpr size_t MAX_HEADER_BYTES = 64 * 1024;
constexpr uint32_t MAX_STORED_RESULTS = 1u << 20;
constexpr size_t MAX_RESULT_STRING = 1024;

std::string HashKey(char prefix, const uint256 &hash) {
  std::string key(1, prefix);
  key.append(reinterpret_cast<const char *>(hash.data()), hash.size());
  return key;
}

std::string ToString(const std::vector<uint8_t> &bytes) {
  return std::string(bytes.begin(), bytes.end());
}

std::span<const uint8_t> AsBytes(const std::string &s) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(s.data()),
                                  s.size());
}

std::string EncodeHash(const uint256 &hash) {
  return std::string(reinterpret_cast<const char *>(hash.data()), hash.size());
}

std::optional<uint256> DecodeHash(const std::string &value) {
  if (value.size() != uint256::size()) {
    return std::nullopt;
  }
  return uint256(AsBytes(value));
}

std::string EncodeState(const ChainState &state) {
  util::Serializer s;
  s.write_hash(state.head_hash);
  s.write_int32(state.head_level);
  s.write_int32(state.checkpoint_level);
  return ToString(s.data());
}

bool DecodeState(const std::string &value, ChainState &out) {
  util::Deserializer d(AsBytes(value));
  out.head_hash = d.read_hash();
  out.head_level = d.read_int32();
  out.checkpoint_level = d.read_int32();
  return d.at_end();
}

std::string EncodeOperations(const chain::OperationsList &ops) {
  util::Serializer s;
  chain::SerializeOperationsList(s, ops);
  return ToString(s.data());
}

} // namespace

ChainStorage::ChainStorage(KeyValueStore &store, chain::ChainId chain_id)
    : store_(store), chain_id_(chain_id) {}

std::string ChainStorage::BlockKey(const uint256 &hash) {
  return HashKey(PREFIX_BLOCK, hash);
}

std::string ChainStorage::OperationsKey(const uint256 &hash, uint8_t pass) {
  std::string key = HashKey(PREFIX_OPERATIONS, hash);
  key.push_back(static_cast<char>(pass));
  return key;
}

std::string ChainStorage::ContextKey(const uint256 &hash) {
  return HashKey(PREFIX_CONTEXT, hash);
}

std::string ChainStorage::LevelKey(int32_t level) {
  std::string key(1, PREFIX_LEVEL);
  uint8_t buf[4];
  endian::WriteBE32(buf, static_cast<uint32_t>(level));
  key.append(reinterpret_cast<const char *>(buf), sizeof(buf));
  return key;
}

std::string ChainStorage::ChainStateKey() const {
  std::string key(1, PREFIX_STATE);
  uint8_t buf[4];
  endian::WriteBE32(buf, chain_id_);
  key.append(reinterpret_cast<const char *>(buf), sizeof(buf));
  return key;
}

std::string ChainStorage::EncodeBlock(const StoredBlock &block) {
  util::Serializer s;
  s.write_uint8(BLOCK_RECORD_VERSION);
  s.write_sized_bytes(block.header.Serialize());
  s.write_bool(block.metadata.applied);
  s.write_int64(block.metadata.applied_time);
  s.write_uint32(static_cast<uint32_t>(block.metadata.operation_results.size()));
  for (const auto &r : block.metadata.operation_results) {
    s.write_string(r.size() > MAX_RESULT_STRING ? r.substr(0, MAX_RESULT_STRING)
                                                : r);
  }
  return ToString(s.data());
}

bool ChainStorage::DecodeBlock(const std::string &value, StoredBlock &out) {
  util::Deserializer d(AsBytes(value));
  if (d.read_uint8() != BLOCK_RECORD_VERSION) {
    return false;
  }
  auto header_bytes = d.read_sized_bytes(MAX_HEADER_BYTES);
  if (d.has_error() ||
      !out.header.Deserialize(header_bytes.data(), header_bytes.size())) {
    return false;
  }
  out.metadata.applied = d.read_bool();
  out.metadata.applied_time = d.read_int64();
  // Each result is at least its 2-byte length
  uint32_t count = d.read_count(MAX_STORED_RESULTS, 2);
  out.metadata.operation_results.clear();
  for (uint32_t i = 0; i < count && !d.has_error(); ++i) {
    out.metadata.operation_results.push_back(d.read_string(MAX_RESULT_STRING));
  }
  return d.at_end();
}

bool ChainStorage::Initialize(const chain::ChainParams &params) {
  const uint256 genesis_hash = params.GenesisHash();

  if (auto state = GetChainState()) {
    auto level0 = GetCanonicalHash(0);
    if (!level0 || *level0 != genesis_hash) {
      LOG_STORAGE_ERROR("Store belongs to another chain (genesis {} expected {})",
                        level0 ? level0->ToShortString() : "<none>",
                        genesis_hash.ToShortString());
      return false;
    }
    LOG_STORAGE_INFO("Loaded chain state: head={} level={} checkpoint={}",
                     state->head_hash.ToShortString(), state->head_level,
                     state->checkpoint_level);
    return true;
  }

  StoredBlock genesis;
  genesis.header = params.GenesisBlock();
  genesis.metadata.applied = true;
  genesis.metadata.applied_time = genesis.header.timestamp;

  ChainState state;
  state.head_hash = genesis_hash;
  state.head_level = 0;
  state.checkpoint_level = 0;

  WriteBatch batch;
  batch.Put(BlockKey(genesis_hash), EncodeBlock(genesis));
  batch.Put(ContextKey(genesis_hash), EncodeHash(params.GenesisContext()));
  batch.Put(LevelKey(0), EncodeHash(genesis_hash));
  batch.Put(ChainStateKey(), EncodeState(state));
  if (!store_.Write(batch)) {
    LOG_STORAGE_ERROR("Failed to write genesis block");
    return false;
  }
  LOG_STORAGE_INFO("Initialized store with genesis {} ({})",
                   genesis_hash.ToShortString(), params.GetChainTypeString());
  return true;
}

std::optional<ChainState> ChainStorage::GetChainState() const {
  auto value = store_.Get(ChainStateKey());
  if (!value) {
    return std::nullopt;
  }
  ChainState state;
  if (!DecodeState(*value, state)) {
    LOG_STORAGE_ERROR("Corrupt chain state record");
    return std::nullopt;
  }
  return state;
}

bool ChainStorage::HasBlock(const uint256 &hash) const {
  return store_.Exists(BlockKey(hash));
}

std::optional<StoredBlock> ChainStorage::GetBlock(const uint256 &hash) const {
  auto value = store_.Get(BlockKey(hash));
  if (!value) {
    return std::nullopt;
  }
  StoredBlock block;
  if (!DecodeBlock(*value, block)) {
    LOG_STORAGE_ERROR("Corrupt block record {}", hash.ToShortString());
    return std::nullopt;
  }
  return block;
}

std::optional<chain::BlockHeader>
ChainStorage::GetHeader(const uint256 &hash) const {
  auto block = GetBlock(hash);
  if (!block) {
    return std::nullopt;
  }
  return block->header;
}

bool ChainStorage::IsApplied(const uint256 &hash) const {
  auto block = GetBlock(hash);
  return block && block->metadata.applied;
}

bool ChainStorage::StoreHeader(const chain::BlockHeader &header) {
  const uint256 hash = header.GetHash();
  if (HasBlock(hash)) {
    return true;
  }
  StoredBlock block;
  block.header = header;
  return store_.Put(BlockKey(hash), EncodeBlock(block));
}

bool ChainStorage::HasOperations(const uint256 &hash, uint8_t pass) const {
  return store_.Exists(OperationsKey(hash, pass));
}

std::optional<chain::OperationsList>
ChainStorage::GetOperations(const uint256 &hash, uint8_t pass) const {
  auto value = store_.Get(OperationsKey(hash, pass));
  if (!value) {
    return std::nullopt;
  }
  util::Deserializer d(AsBytes(*value));
  chain::OperationsList ops;
  if (!chain::DeserializeOperationsList(d, ops) || !d.at_end()) {
    LOG_STORAGE_ERROR("Corrupt operations record {}/{}", hash.ToShortString(),
                      pass);
    return std::nullopt;
  }
  return ops;
}

bool ChainStorage::StoreOperations(const uint256 &hash, uint8_t pass,
                                   const chain::OperationsList &ops) {
  const std::string key = OperationsKey(hash, pass);
  if (store_.Exists(key)) {
    return true;
  }
  return store_.Put(key, EncodeOperations(ops));
}

std::optional<uint256> ChainStorage::GetContext(const uint256 &hash) const {
  auto value = store_.Get(ContextKey(hash));
  if (!value) {
    return std::nullopt;
  }
  return DecodeHash(*value);
}

std::optional<uint256> ChainStorage::GetCanonicalHash(int32_t level) const {
  if (level < 0) {
    return std::nullopt;
  }
  auto value = store_.Get(LevelKey(level));
  if (!value) {
    return std::nullopt;
  }
  return DecodeHash(*value);
}

bool ChainStorage::IsCanonical(const uint256 &hash, int32_t level) const {
  auto canonical = GetCanonicalHash(level);
  return canonical && *canonical == hash;
}

std::vector<uint256> ChainStorage::GetBranchHistory(size_t max_entries) const {
  std::vector<uint256> history;
  auto state = GetChainState();
  if (!state || max_entries == 0) {
    return history;
  }

  int32_t step = 1;
  int32_t level = state->head_level - 1;
  int32_t last_level = -1;
  while (level >= 0 && history.size() < max_entries) {
    auto hash = GetCanonicalHash(level);
    if (!hash) {
      break;
    }
    history.push_back(*hash);
    last_level = level;
    level -= step;
    step *= 2;
  }
  if (last_level > 0 && history.size() < max_entries) {
    if (auto genesis = GetCanonicalHash(0)) {
      history.push_back(*genesis);
    }
  }
  return history;
}

std::optional<chain::Branch>
ChainStorage::GetCurrentBranch(size_t max_history) const {
  auto state = GetChainState();
  if (!state) {
    return std::nullopt;
  }
  auto head = GetHeader(state->head_hash);
  if (!head) {
    LOG_STORAGE_ERROR("Head block {} missing from block store",
                      state->head_hash.ToShortString());
    return std::nullopt;
  }
  chain::Branch branch;
  branch.head = std::move(*head);
  branch.history = GetBranchHistory(max_history);
  return branch;
}

std::optional<CommitOutcome>
ChainStorage::CommitApplication(const BlockCommit &commit) {
  auto current = GetChainState();
  if (!current) {
    LOG_STORAGE_ERROR("Commit without chain state");
    return std::nullopt;
  }

  const uint256 hash = commit.header.GetHash();
  const int32_t level = commit.header.level;

  WriteBatch batch;

  StoredBlock block;
  block.header = commit.header;
  block.metadata = commit.metadata;
  block.metadata.applied = true;
  batch.Put(BlockKey(hash), EncodeBlock(block));

  for (size_t pass = 0; pass < commit.operations.size(); ++pass) {
    batch.Put(OperationsKey(hash, static_cast<uint8_t>(pass)),
              EncodeOperations(commit.operations[pass]));
  }
  batch.Put(ContextKey(hash), EncodeHash(commit.context_hash));

  CommitOutcome outcome;
  outcome.state = *current;

  if (level > current->head_level) {
    outcome.head_advanced = true;
    outcome.state.head_hash = hash;
    outcome.state.head_level = level;
    if (commit.history_window > 0) {
      outcome.state.checkpoint_level =
          std::max(current->checkpoint_level, level - commit.history_window);
    }

    // Point the level index at the new branch until it rejoins the old one
    batch.Put(LevelKey(level), EncodeHash(hash));
    uint256 cursor = commit.header.predecessor;
    for (int32_t l = level - 1; l >= 0; --l) {
      auto canonical = GetCanonicalHash(l);
      if (canonical && *canonical == cursor) {
        break;
      }
      if (l <= current->checkpoint_level) {
        LOG_STORAGE_ERROR("Refusing to move head across checkpoint {} (block {})",
                          current->checkpoint_level, hash.ToShortString());
        return std::nullopt;
      }
      auto header = GetHeader(cursor);
      if (!header || header->level != l) {
        LOG_STORAGE_ERROR("Missing ancestor {} at level {} while committing {}",
                          cursor.ToShortString(), l, hash.ToShortString());
        return std::nullopt;
      }
      batch.Put(LevelKey(l), EncodeHash(cursor));
      cursor = header->predecessor;
    }
    batch.Put(ChainStateKey(), EncodeState(outcome.state));
  }

  if (!store_.Write(batch)) {
    return std::nullopt;
  }
  return outcome;
}

std::vector<chain::BlockHeader> ChainStorage::LoadUnappliedHeaders() const {
  std::vector<chain::BlockHeader> headers;
  auto state = GetChainState();
  const int32_t checkpoint = state ? state->checkpoint_level : 0;

  for (const auto &[key, value] :
       store_.PrefixScan(std::string(1, PREFIX_BLOCK))) {
    StoredBlock block;
    if (!DecodeBlock(value, block)) {
      LOG_STORAGE_WARN("Skipping corrupt block record during recovery");
      continue;
    }
    if (!block.metadata.applied && block.header.level > checkpoint) {
      headers.push_back(std::move(block.header));
    }
  }
  std::sort(headers.begin(), headers.end(),
            [](const chain::BlockHeader &a, const chain::BlockHeader &b) {
              return a.level < b.level;
            });
  return headers;
}

int ChainStorage::PruneBelow(int32_t level) {
  auto state = GetChainState();
  if (!state) {
    return -1;
  }
  level = std::min(level, state->checkpoint_level);

  std::string marker_key(1, PREFIX_PRUNED);
  marker_key += ChainStateKey().substr(1);
  int32_t pruned_to = 0;
  if (auto marker = store_.Get(marker_key); marker && marker->size() == 4) {
    pruned_to = static_cast<int32_t>(
        endian::ReadBE32(reinterpret_cast<const uint8_t *>(marker->data())));
  }
  if (level <= pruned_to + 1) {
    return 0;
  }

  WriteBatch batch;
  int pruned = 0;
  // Genesis context is kept: level 0 is never pruned
  for (int32_t l = std::max(1, pruned_to + 1); l < level; ++l) {
    auto hash = GetCanonicalHash(l);
    if (!hash || *hash == state->head_hash) {
      continue;
    }
    auto header = GetHeader(*hash);
    if (!header) {
      continue;
    }
    for (uint8_t pass = 0; pass < header->validation_passes; ++pass) {
      batch.Delete(OperationsKey(*hash, pass));
    }
    batch.Delete(ContextKey(*hash));
    ++pruned;
  }

  uint8_t buf[4];
  endian::WriteBE32(buf, static_cast<uint32_t>(level - 1));
  batch.Put(marker_key, std::string(reinterpret_cast<const char *>(buf), 4));

  if (!store_.Write(batch)) {
    LOG_STORAGE_ERROR("Prune batch below level {} failed", level);
    return -1;
  }
  if (pruned > 0) {
    LOG_STORAGE_INFO("Pruned operations and contexts of {} blocks below level {}",
                     pruned, level);
  }
  return pruned;
}

} // namespace storage
} // namespace stakenode
