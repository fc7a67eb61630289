// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_STORAGE_KV_STORE_HPP
#define STAKENODE_STORAGE_KV_STORE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stakenode {
namespace storage {

// Thrown only when a store cannot be opened at all
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * Ordered set of puts and deletes applied all-or-nothing by
 * KeyValueStore::Write().
 */
class WriteBatch {
public:
  enum class OpType { PUT, DELETE };

  struct Op {
    OpType type;
    std::string key;
    std::string value;
  };

  void Put(std::string key, std::string value) {
    ops_.push_back({OpType::PUT, std::move(key), std::move(value)});
  }
  void Delete(std::string key) {
    ops_.push_back({OpType::DELETE, std::move(key), {}});
  }

  const std::vector<Op> &Ops() const { return ops_; }
  size_t Size() const { return ops_.size(); }
  bool Empty() const { return ops_.empty(); }
  void Clear() { ops_.clear(); }

private:
  std::vector<Op> ops_;
};

/**
 * KeyValueStore - durable ordered map
 *
 * Write() is atomic and durable on return: after a crash either every
 * operation of the batch is visible or none is. Implementations are safe to
 * call from several threads.
 */
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  // nullopt when absent (read errors are logged and reported as absent)
  virtual std::optional<std::string> Get(const std::string &key) const = 0;

  virtual bool Exists(const std::string &key) const {
    return Get(key).has_value();
  }

  // Single synced put
  virtual bool Put(const std::string &key, const std::string &value) = 0;

  // Atomic, synced batch commit; false means nothing was applied
  virtual bool Write(const WriteBatch &batch) = 0;

  // All entries whose key starts with prefix, in key order
  virtual std::vector<std::pair<std::string, std::string>>
  PrefixScan(const std::string &prefix) const = 0;
};

} // namespace storage
} // namespace stakenode

#endif // STAKENODE_STORAGE_KV_STORE_HPP
