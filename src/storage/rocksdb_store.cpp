// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "storage/rocksdb_store.hpp"
#include "util/logging.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

namespace stakenode {
namespace storage {

namespace {

rocksdb::WriteOptions SyncedWrite() {
  rocksdb::WriteOptions opts;
  opts.sync = true;
  return opts;
}

} // namespace

RocksDbStore::RocksDbStore(const std::filesystem::path &path) : path_(path) {
  rocksdb::Options options;
  options.create_if_missing = true;
  options.OptimizeLevelStyleCompaction();
  options.level_compaction_dynamic_level_bytes = true;
  options.write_buffer_size = 64ULL * 1024 * 1024;
  options.max_open_files = 512;

  rocksdb::DB *raw = nullptr;
  rocksdb::Status status = rocksdb::DB::Open(options, path.string(), &raw);
  if (!status.ok()) {
    throw StorageError("Failed to open RocksDB at " + path.string() + ": " +
                       status.ToString());
  }
  db_.reset(raw);
  LOG_STORAGE_INFO("Opened block store at {}", path.string());
}

RocksDbStore::~RocksDbStore() {
  if (db_) {
    rocksdb::Status status = db_->Close();
    if (!status.ok()) {
      LOG_STORAGE_WARN("RocksDB close reported: {}", status.ToString());
    }
  }
}

std::optional<std::string> RocksDbStore::Get(const std::string &key) const {
  std::string value;
  rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), key, &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    LOG_STORAGE_ERROR("RocksDB read failed: {}", status.ToString());
    return std::nullopt;
  }
  return value;
}

bool RocksDbStore::Put(const std::string &key, const std::string &value) {
  rocksdb::Status status = db_->Put(SyncedWrite(), key, value);
  if (!status.ok()) {
    LOG_STORAGE_ERROR("RocksDB put failed: {}", status.ToString());
    return false;
  }
  return true;
}

bool RocksDbStore::Write(const WriteBatch &batch) {
  rocksdb::WriteBatch wb;
  for (const auto &op : batch.Ops()) {
    rocksdb::Status s = op.type == WriteBatch::OpType::PUT
                            ? wb.Put(op.key, op.value)
                            : wb.Delete(op.key);
    if (!s.ok()) {
      LOG_STORAGE_ERROR("RocksDB batch build failed: {}", s.ToString());
      return false;
    }
  }
  rocksdb::Status status = db_->Write(SyncedWrite(), &wb);
  if (!status.ok()) {
    LOG_STORAGE_ERROR("RocksDB batch commit failed ({} ops): {}", batch.Size(),
                      status.ToString());
    return false;
  }
  return true;
}

std::vector<std::pair<std::string, std::string>>
RocksDbStore::PrefixScan(const std::string &prefix) const {
  std::vector<std::pair<std::string, std::string>> results;
  std::unique_ptr<rocksdb::Iterator> it(
      db_->NewIterator(rocksdb::ReadOptions()));
  for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix);
       it->Next()) {
    results.emplace_back(it->key().ToString(), it->value().ToString());
  }
  if (!it->status().ok()) {
    LOG_STORAGE_ERROR("RocksDB scan failed: {}", it->status().ToString());
  }
  return results;
}

} // namespace storage
} // namespace stakenode
