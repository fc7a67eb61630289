// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_STORAGE_MEMORY_STORE_HPP
#define STAKENODE_STORAGE_MEMORY_STORE_HPP

#include "storage/kv_store.hpp"
#include <map>
#include <mutex>

namespace stakenode {
namespace storage {

/**
 * In-memory KeyValueStore for tests and throwaway sandbox runs.
 *
 * FailNextWrites(n) makes the next n Put/Write calls fail without applying
 * anything, which lets tests drive the storage-failure path.
 */
class MemoryStore : public KeyValueStore {
public:
  std::optional<std::string> Get(const std::string &key) const override;
  bool Put(const std::string &key, const std::string &value) override;
  bool Write(const WriteBatch &batch) override;
  std::vector<std::pair<std::string, std::string>>
  PrefixScan(const std::string &prefix) const override;

  void FailNextWrites(int count);
  size_t Size() const;
  size_t WriteCount() const;

private:
  bool ConsumeFailure();

  mutable std::mutex mutex_;
  std::map<std::string, std::string> data_;
  int fail_writes_{0};
  size_t write_count_{0};
};

} // namespace storage
} // namespace stakenode

#endif // STAKENODE_STORAGE_MEMORY_STORE_HPP
