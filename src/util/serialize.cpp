// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "util/serialize.hpp"
#include "util/endian.hpp"

namespace stakenode {
namespace util {

void Serializer::write_uint16(uint16_t v) {
  uint8_t buf[2];
  endian::WriteBE16(buf, v);
  write_bytes(buf, sizeof(buf));
}

void Serializer::write_uint32(uint32_t v) {
  uint8_t buf[4];
  endian::WriteBE32(buf, v);
  write_bytes(buf, sizeof(buf));
}

void Serializer::write_uint64(uint64_t v) {
  uint8_t buf[8];
  endian::WriteBE64(buf, v);
  write_bytes(buf, sizeof(buf));
}

void Serializer::write_bytes(const uint8_t *data, size_t size) {
  if (size == 0)
    return;
  buffer_.insert(buffer_.end(), data, data + size);
}

void Serializer::write_sized_bytes(std::span<const uint8_t> data) {
  write_uint32(static_cast<uint32_t>(data.size()));
  write_bytes(data);
}

void Serializer::write_string(const std::string &s) {
  write_uint16(static_cast<uint16_t>(s.size()));
  write_bytes(reinterpret_cast<const uint8_t *>(s.data()), s.size());
}

bool Deserializer::need(size_t n) {
  if (error_ || size_ - pos_ < n) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t Deserializer::read_uint8() {
  if (!need(1))
    return 0;
  return data_[pos_++];
}

bool Deserializer::read_bool() {
  uint8_t v = read_uint8();
  if (v > 1) {
    error_ = true;
    return false;
  }
  return v == 1;
}

uint16_t Deserializer::read_uint16() {
  if (!need(2))
    return 0;
  uint16_t v = endian::ReadBE16(data_ + pos_);
  pos_ += 2;
  return v;
}

uint32_t Deserializer::read_uint32() {
  if (!need(4))
    return 0;
  uint32_t v = endian::ReadBE32(data_ + pos_);
  pos_ += 4;
  return v;
}

uint64_t Deserializer::read_uint64() {
  if (!need(8))
    return 0;
  uint64_t v = endian::ReadBE64(data_ + pos_);
  pos_ += 8;
  return v;
}

std::vector<uint8_t> Deserializer::read_bytes(size_t count) {
  if (!need(count))
    return {};
  std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + count);
  pos_ += count;
  return out;
}

uint256 Deserializer::read_hash() {
  if (!need(uint256::size()))
    return uint256();
  uint256 h(std::span<const uint8_t>(data_ + pos_, uint256::size()));
  pos_ += uint256::size();
  return h;
}

std::vector<uint8_t> Deserializer::read_sized_bytes(size_t max_size) {
  uint32_t len = read_uint32();
  if (error_ || len > max_size) {
    error_ = true;
    return {};
  }
  return read_bytes(len);
}

std::string Deserializer::read_string(size_t max_size) {
  uint16_t len = read_uint16();
  if (error_ || len > max_size || !need(len)) {
    error_ = true;
    return {};
  }
  std::string out(reinterpret_cast<const char *>(data_ + pos_), len);
  pos_ += len;
  return out;
}

uint32_t Deserializer::read_count(uint32_t max_count, size_t min_element_size) {
  uint32_t count = read_uint32();
  if (error_ || count > max_count) {
    error_ = true;
    return 0;
  }
  // Reject before allocating: the input must be able to hold that many items
  if (min_element_size > 0 &&
      static_cast<uint64_t>(count) * min_element_size > size_ - pos_) {
    error_ = true;
    return 0;
  }
  return count;
}

} // namespace util
} // namespace stakenode
