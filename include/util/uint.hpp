// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_UTIL_UINT_HPP
#define STAKENODE_UTIL_UINT_HPP

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace stakenode {

/**
 * Fixed-size opaque blob (Bitcoin Core base_blob style).
 *
 * Unlike Bitcoin, the hex form is the natural byte order: byte 0 is printed
 * first. Block, operation and context hashes all use uint256.
 */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "blob width must be whole bytes");
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  // Caller must pass exactly WIDTH bytes
  constexpr explicit base_blob(std::span<const uint8_t> vch) : m_data() {
    if (vch.size() == static_cast<size_t>(WIDTH)) {
      std::copy(vch.begin(), vch.end(), m_data.begin());
    }
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  std::string GetHex() const {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(WIDTH * 2);
    for (uint8_t b : m_data) {
      out.push_back(digits[b >> 4]);
      out.push_back(digits[b & 0x0f]);
    }
    return out;
  }

  // Abbreviated form for log lines
  std::string ToShortString() const { return GetHex().substr(0, 12); }

  // Requires exactly 2*WIDTH hex digits
  bool SetHex(std::string_view str) {
    if (str.size() != static_cast<size_t>(WIDTH) * 2) {
      return false;
    }
    std::array<uint8_t, WIDTH> parsed{};
    for (size_t i = 0; i < parsed.size(); ++i) {
      int hi = HexDigit(str[2 * i]);
      int lo = HexDigit(str[2 * i + 1]);
      if (hi < 0 || lo < 0) {
        return false;
      }
      parsed[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    m_data = parsed;
    return true;
  }

  constexpr const uint8_t *data() const { return m_data.data(); }
  constexpr uint8_t *data() { return m_data.data(); }

  constexpr uint8_t *begin() { return m_data.data(); }
  constexpr uint8_t *end() { return m_data.data() + WIDTH; }
  constexpr const uint8_t *begin() const { return m_data.data(); }
  constexpr const uint8_t *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  // First 8 bytes, for hashing containers
  constexpr uint64_t GetUint64(int pos) const {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i) {
      x |= static_cast<uint64_t>(m_data[pos * 8 + i]) << (8 * i);
    }
    return x;
  }

private:
  static constexpr int HexDigit(char c) {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  }
};

/** 256-bit opaque blob. */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(std::span<const uint8_t> vch) : base_blob<256>(vch) {}

  static std::optional<uint256> FromHex(std::string_view str) {
    uint256 rv;
    if (!rv.SetHex(str)) {
      return std::nullopt;
    }
    return rv;
  }

  static const uint256 ZERO;
};

inline const uint256 uint256::ZERO = uint256();

/** Hasher for unordered containers keyed by uint256. */
struct Uint256Hasher {
  size_t operator()(const uint256 &h) const {
    return static_cast<size_t>(h.GetUint64(0));
  }
};

} // namespace stakenode

#endif // STAKENODE_UTIL_UINT_HPP
