#include "time.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

namespace fleet::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t MillisSince(TimePoint start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

int RemainingMillis(TimePoint deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  if (left <= 0) return 0;
  return static_cast<int>(std::min<int64_t>(left, std::numeric_limits<int>::max()));
}

std::optional<uint64_t> ParseMillis(std::string_view text) {
  if (text.empty() || text.front() < '0' || text.front() > '9') return std::nullopt;

  uint64_t   value = 0;
  const auto end   = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  if (value > static_cast<uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) return std::nullopt;
  return value;
}

} // namespace fleet::util
