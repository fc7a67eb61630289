// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#pragma once

#include <cstdint>

// Big-endian (network order) integer helpers for the wire and storage codecs

namespace stakenode {
namespace endian {

inline uint16_t ReadBE16(const uint8_t *p) {
  return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
}

inline uint32_t ReadBE32(const uint8_t *p) {
  return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
         (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline uint64_t ReadBE64(const uint8_t *p) {
  return (uint64_t(ReadBE32(p)) << 32) | uint64_t(ReadBE32(p + 4));
}

inline void WriteBE16(uint8_t *p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v >> 8);
  p[1] = static_cast<uint8_t>(v);
}

inline void WriteBE32(uint8_t *p, uint32_t v) {
  p[0] = static_cast<uint8_t>(v >> 24);
  p[1] = static_cast<uint8_t>(v >> 16);
  p[2] = static_cast<uint8_t>(v >> 8);
  p[3] = static_cast<uint8_t>(v);
}

inline void WriteBE64(uint8_t *p, uint64_t v) {
  WriteBE32(p, static_cast<uint32_t>(v >> 32));
  WriteBE32(p + 4, static_cast<uint32_t>(v));
}

} // namespace endian
} // namespace stakenode
