#pragma once

#include <cstdint>
#include <ctime>

namespace Common {

// Nanoseconds from CLOCK_MONOTONIC, for measuring durations
inline uint64_t getNanosSinceEpoch() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Nanoseconds from CLOCK_REALTIME, stamped on every log record
inline uint64_t getWallClockNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

} // namespace Common
