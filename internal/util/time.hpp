#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace fleet::util {

/*
  Time utilities. Single place to control the clock source.

  Deadlines use the monotonic clock so wall-clock jumps never shorten or
  extend a module timeout.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t MillisSince(TimePoint start);

// Milliseconds until deadline, clamped to [0, INT32_MAX] for poll(2).
int RemainingMillis(TimePoint deadline);

// Decimal millisecond count, digits only. nullopt for anything else,
// including values past what std::chrono::milliseconds holds.
std::optional<uint64_t> ParseMillis(std::string_view text);

} // namespace fleet::util
