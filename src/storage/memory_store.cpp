// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "storage/memory_store.hpp"

namespace stakenode {
namespace storage {

std::optional<std::string> MemoryStore::Get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = data_.find(key);
  if (it == data_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryStore::ConsumeFailure() {
  if (fail_writes_ > 0) {
    --fail_writes_;
    return true;
  }
  return false;
}

bool MemoryStore::Put(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ConsumeFailure()) {
    return false;
  }
  data_[key] = value;
  ++write_count_;
  return true;
}

bool MemoryStore::Write(const WriteBatch &batch) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ConsumeFailure()) {
    return false;
  }
  for (const auto &op : batch.Ops()) {
    if (op.type == WriteBatch::OpType::PUT) {
      data_[op.key] = op.value;
    } else {
      data_.erase(op.key);
    }
  }
  ++write_count_;
  return true;
}

std::vector<std::pair<std::string, std::string>>
MemoryStore::PrefixScan(const std::string &prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<std::string, std::string>> results;
  for (auto it = data_.lower_bound(prefix);
       it != data_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
       ++it) {
    results.emplace_back(it->first, it->second);
  }
  return results;
}

void MemoryStore::FailNextWrites(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_writes_ = count;
}

size_t MemoryStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.size();
}

size_t MemoryStore::WriteCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return write_count_;
}

} // namespace storage
} // namespace stakenode
