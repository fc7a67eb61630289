// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "crypto/hash.hpp"
#include <sstream>

namespace stakenode {
namespace chain {

uint256 Operation::GetHash() const {
  util::Serializer s;
  Serialize(s);
  return crypto::Sha256(s.data());
}

void Operation::Serialize(util::Serializer &s) const {
  s.write_hash(branch);
  s.write_sized_bytes(data);
}

bool Operation::Deserialize(util::Deserializer &d, Operation &out) {
  out.branch = d.read_hash();
  out.data = d.read_sized_bytes(MAX_OPERATION_DATA_SIZE);
  return !d.has_error();
}

uint256 ComputeOperationsListHash(const OperationsList &ops) {
  crypto::HashWriter hw;
  uint8_t count[4] = {static_cast<uint8_t>(ops.size() >> 24),
                      static_cast<uint8_t>(ops.size() >> 16),
                      static_cast<uint8_t>(ops.size() >> 8),
                      static_cast<uint8_t>(ops.size())};
  hw.Write(std::span<const uint8_t>(count, sizeof(count)));
  for (const auto &op : ops) {
    hw.Write(op.GetHash());
  }
  return hw.GetHash();
}

void SerializeOperationsList(util::Serializer &s, const OperationsList &ops) {
  s.write_uint32(static_cast<uint32_t>(ops.size()));
  for (const auto &op : ops) {
    op.Serialize(s);
  }
}

bool DeserializeOperationsList(util::Deserializer &d, OperationsList &out) {
  // 32-byte branch + 4-byte length is the smallest encoded operation
  uint32_t count = d.read_count(MAX_OPERATIONS_PER_PASS, 36);
  if (d.has_error()) {
    return false;
  }
  out.clear();
  out.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    Operation op;
    if (!Operation::Deserialize(d, op)) {
      return false;
    }
    out.push_back(std::move(op));
  }
  return true;
}

uint256 BlockHeader::GetHash() const { return crypto::Sha256(Serialize()); }

std::vector<uint8_t> BlockHeader::Serialize() const {
  util::Serializer s;
  Serialize(s);
  return s.release();
}

void BlockHeader::Serialize(util::Serializer &s) const {
  s.write_int32(level);
  s.write_uint8(proto);
  s.write_hash(predecessor);
  s.write_int64(timestamp);
  s.write_uint8(validation_passes);
  for (const auto &h : operations_hashes) {
    s.write_hash(h);
  }
  s.write_uint8(static_cast<uint8_t>(fitness.size()));
  for (const auto &element : fitness) {
    s.write_sized_bytes(element);
  }
  s.write_uint16(priority);
  s.write_sized_bytes(signature);
}

bool BlockHeader::Deserialize(util::Deserializer &d, BlockHeader &out) {
  out.level = d.read_int32();
  out.proto = d.read_uint8();
  out.predecessor = d.read_hash();
  out.timestamp = d.read_int64();
  out.validation_passes = d.read_uint8();
  if (d.has_error() || out.validation_passes > MAX_VALIDATION_PASSES) {
    return false;
  }
  out.operations_hashes.clear();
  for (uint8_t i = 0; i < out.validation_passes; ++i) {
    out.operations_hashes.push_back(d.read_hash());
  }

  uint8_t fitness_count = d.read_uint8();
  if (d.has_error() || fitness_count > MAX_FITNESS_ELEMENTS) {
    return false;
  }
  out.fitness.clear();
  for (uint8_t i = 0; i < fitness_count; ++i) {
    out.fitness.push_back(d.read_sized_bytes(MAX_FITNESS_ELEMENT_SIZE));
  }

  out.priority = d.read_uint16();
  out.signature = d.read_sized_bytes(MAX_SIGNATURE_SIZE);
  return !d.has_error();
}

bool BlockHeader::Deserialize(const uint8_t *data, size_t size) {
  util::Deserializer d(data, size);
  if (!Deserialize(d, *this)) {
    return false;
  }
  return d.at_end();
}

bool BlockHeader::CheckStructure(std::string &reason,
                                 bool allow_genesis) const {
  if (validation_passes > MAX_VALIDATION_PASSES) {
    reason = "too-many-validation-passes";
    return false;
  }
  if (operations_hashes.size() != validation_passes) {
    reason = "operations-hashes-count-mismatch";
    return false;
  }
  if (level < 1 && !(allow_genesis && level == 0)) {
    reason = "bad-level";
    return false;
  }
  if (fitness.size() > MAX_FITNESS_ELEMENTS) {
    reason = "fitness-too-long";
    return false;
  }
  if (signature.size() > MAX_SIGNATURE_SIZE) {
    reason = "signature-too-long";
    return false;
  }
  return true;
}

std::string BlockHeader::ToString() const {
  std::stringstream s;
  s << "BlockHeader(";
  s << "hash=" << GetHash().ToShortString();
  s << ", level=" << level;
  s << ", proto=" << static_cast<int>(proto);
  s << ", predecessor=" << predecessor.ToShortString();
  s << ", timestamp=" << timestamp;
  s << ", passes=" << static_cast<int>(validation_passes);
  s << ", priority=" << priority;
  s << ")";
  return s.str();
}

void Branch::Serialize(util::Serializer &s) const {
  head.Serialize(s);
  s.write_uint32(static_cast<uint32_t>(history.size()));
  for (const auto &h : history) {
    s.write_hash(h);
  }
}

bool Branch::Deserialize(util::Deserializer &d, Branch &out) {
  if (!BlockHeader::Deserialize(d, out.head)) {
    return false;
  }
  uint32_t count = d.read_count(MAX_BRANCH_HISTORY, uint256::size());
  out.history.clear();
  for (uint32_t i = 0; i < count && !d.has_error(); ++i) {
    out.history.push_back(d.read_hash());
  }
  return !d.has_error();
}

} // namespace chain
} // namespace stakenode
