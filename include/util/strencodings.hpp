// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_UTIL_STRENCODINGS_HPP
#define STAKENODE_UTIL_STRENCODINGS_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stakenode {
namespace util {

// Lower-case hex encoding
std::string HexStr(std::span<const uint8_t> data);

// Parses an even-length hex string; nullopt on any non-hex character
std::optional<std::vector<uint8_t>> ParseHex(std::string_view str);

// Trim ASCII whitespace on both ends
std::string TrimString(std::string_view str);

// Strict decimal parsers (whole string must be consumed)
std::optional<int64_t> ParseInt64(std::string_view str);
std::optional<uint64_t> ParseUInt64(std::string_view str);

// Splits "host:port"; handles [v6]:port. Port is 0 when absent.
bool SplitHostPort(std::string_view in, std::string &host, uint16_t &port);

} // namespace util
} // namespace stakenode

#endif // STAKENODE_UTIL_STRENCODINGS_HPP
