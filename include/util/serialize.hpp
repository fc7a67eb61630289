// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_UTIL_SERIALIZE_HPP
#define STAKENODE_UTIL_SERIALIZE_HPP

#include "util/uint.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace stakenode {
namespace util {

/**
 * Append-only big-endian writer used by every binary codec (wire messages,
 * block headers, storage records).
 */
class Serializer {
public:
  void write_uint8(uint8_t v) { buffer_.push_back(v); }
  void write_bool(bool v) { buffer_.push_back(v ? 1 : 0); }
  void write_uint16(uint16_t v);
  void write_uint32(uint32_t v);
  void write_uint64(uint64_t v);
  void write_int32(int32_t v) { write_uint32(static_cast<uint32_t>(v)); }
  void write_int64(int64_t v) { write_uint64(static_cast<uint64_t>(v)); }

  void write_bytes(const uint8_t *data, size_t size);
  void write_bytes(std::span<const uint8_t> data) {
    write_bytes(data.data(), data.size());
  }
  void write_hash(const uint256 &hash) { write_bytes(hash.data(), hash.size()); }

  // uint32 length followed by the bytes
  void write_sized_bytes(std::span<const uint8_t> data);
  // uint16 length followed by the characters
  void write_string(const std::string &s);

  const std::vector<uint8_t> &data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Bounds-checked reader. The first short read or over-limit length latches
 * has_error(); every later read returns zero values, so decoders can read a
 * whole structure and check once at the end.
 */
class Deserializer {
public:
  Deserializer(const uint8_t *data, size_t size)
      : data_(data), size_(size), pos_(0), error_(false) {}
  explicit Deserializer(std::span<const uint8_t> data)
      : Deserializer(data.data(), data.size()) {}

  uint8_t read_uint8();
  bool read_bool();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int32_t read_int32() { return static_cast<int32_t>(read_uint32()); }
  int64_t read_int64() { return static_cast<int64_t>(read_uint64()); }

  std::vector<uint8_t> read_bytes(size_t count);
  uint256 read_hash();

  // uint32 length (<= max_size) followed by the bytes
  std::vector<uint8_t> read_sized_bytes(size_t max_size);
  std::string read_string(size_t max_size);

  // Element count for a collection; errors when above max_count or when the
  // remaining input cannot hold count * min_element_size bytes
  uint32_t read_count(uint32_t max_count, size_t min_element_size = 1);

  bool has_error() const { return error_; }
  void set_error() { error_ = true; }
  size_t bytes_remaining() const { return error_ ? 0 : size_ - pos_; }
  bool at_end() const { return !error_ && pos_ == size_; }

private:
  bool need(size_t n);

  const uint8_t *data_;
  size_t size_;
  size_t pos_;
  bool error_;
};

} // namespace util
} // namespace stakenode

#endif // STAKENODE_UTIL_SERIALIZE_HPP
