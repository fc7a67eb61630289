// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "util/strencodings.hpp"
#include <charconv>

namespace stakenode {
namespace util {

namespace {

int HexDigitValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string HexStr(std::span<const uint8_t> data) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> ParseHex(std::string_view str) {
  if (str.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexDigitValue(str[i]);
    int lo = HexDigitValue(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string TrimString(std::string_view str) {
  constexpr std::string_view ws = " \t\r\n";
  size_t begin = str.find_first_not_of(ws);
  if (begin == std::string_view::npos) {
    return {};
  }
  size_t end = str.find_last_not_of(ws);
  return std::string(str.substr(begin, end - begin + 1));
}

std::optional<int64_t> ParseInt64(std::string_view str) {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size() || str.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint64_t> ParseUInt64(std::string_view str) {
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size() || str.empty()) {
    return std::nullopt;
  }
  return value;
}

bool SplitHostPort(std::string_view in, std::string &host, uint16_t &port) {
  port = 0;
  host.clear();
  if (in.empty()) {
    return false;
  }

  size_t colon = in.rfind(':');
  bool bracketed = in.front() == '[';
  // A bare IPv6 literal has several colons and no brackets: no port present
  bool has_port = colon != std::string_view::npos &&
                  (bracketed ? (colon > 0 && in[colon - 1] == ']')
                             : in.find(':') == colon);

  std::string_view host_part = in;
  if (has_port) {
    auto parsed = ParseUInt64(in.substr(colon + 1));
    if (!parsed || *parsed == 0 || *parsed > 65535) {
      return false;
    }
    port = static_cast<uint16_t>(*parsed);
    host_part = in.substr(0, colon);
  }

  if (host_part.size() >= 2 && host_part.front() == '[' &&
      host_part.back() == ']') {
    host_part = host_part.substr(1, host_part.size() - 2);
  }
  host = std::string(host_part);
  return !host.empty();
}

} // namespace util
} // namespace stakenode
