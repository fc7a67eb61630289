// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_STORAGE_ROCKSDB_STORE_HPP
#define STAKENODE_STORAGE_ROCKSDB_STORE_HPP

#include "storage/kv_store.hpp"
#include <filesystem>
#include <memory>

namespace rocksdb {
class DB;
}

namespace stakenode {
namespace storage {

/**
 * RocksDB-backed store. Every Put/Write uses WriteOptions::sync so a
 * returned true survives power loss.
 */
class RocksDbStore : public KeyValueStore {
public:
  // Throws StorageError when the database cannot be opened
  explicit RocksDbStore(const std::filesystem::path &path);
  ~RocksDbStore() override;

  RocksDbStore(const RocksDbStore &) = delete;
  RocksDbStore &operator=(const RocksDbStore &) = delete;

  std::optional<std::string> Get(const std::string &key) const override;
  bool Put(const std::string &key, const std::string &value) override;
  bool Write(const WriteBatch &batch) override;
  std::vector<std::pair<std::string, std::string>>
  PrefixScan(const std::string &prefix) const override;

  const std::filesystem::path &Path() const { return path_; }

private:
  std::filesystem::path path_;
  std::unique_ptr<rocksdb::DB> db_;
};

} // namespace storage
} // namespace stakenode

#endif // STAKENODE_STORAGE_ROCKSDB_STORE_HPP
