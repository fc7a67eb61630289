// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_UTIL_TIME_HPP
#define STAKENODE_UTIL_TIME_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace stakenode {
namespace util {

/**
 * Mockable clocks.
 *
 * All code that makes timeout, ban or cool-down decisions reads time through
 * these functions so tests can drive it with SetMockTime().
 */

// Current unix time in seconds (mock time if set)
int64_t GetTime();

// Monotonic clock; advances with mock time while mock time is active
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (0 disables mocking)
void SetMockTime(int64_t time);
int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

} // namespace util
} // namespace stakenode

#endif // STAKENODE_UTIL_TIME_HPP
