#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace uuidcraft::timestamp {

  // 100-nanosecond intervals per second
  constexpr uint64_t TICKS_PER_SECOND = 10000000;
  constexpr uint64_t TICKS_PER_MILLI = 10000;

  // Unix seconds at 1582-10-15T00:00:00Z (Gregorian reform)
  constexpr int64_t GREGORIAN_EPOCH_SECONDS = -12219292800LL;

  // Largest value a UUID can carry: 60 bits
  constexpr uint64_t TIMESTAMP_MASK = 0x0FFFFFFFFFFFFFFFULL;

  // Point in time as Unix seconds plus nanoseconds. Wider than
  // system_clock::time_point, which cannot reach the year 5236.
  struct Instant {
    int64_t seconds = 0;
    uint32_t nanos = 0;  // [0, 999999999]

    friend bool operator==(const Instant& a, const Instant& b) {
      return a.seconds == b.seconds && a.nanos == b.nanos;
    }
    friend bool operator!=(const Instant& a, const Instant& b) { return !(a == b); }
    friend bool operator<(const Instant& a, const Instant& b) {
      return a.seconds < b.seconds || (a.seconds == b.seconds && a.nanos < b.nanos);
    }
  };

  uint64_t to_timestamp(const Instant& instant);
  Instant to_instant(uint64_t timestamp);

  uint64_t to_timestamp(std::chrono::system_clock::time_point tp);
  Instant from_time_point(std::chrono::system_clock::time_point tp);

  // Unix milliseconds <-> timestamp (millisecond precision)
  uint64_t from_unix_milliseconds(int64_t millis);
  int64_t to_unix_milliseconds(uint64_t timestamp);

  int64_t current_unix_milliseconds();
  uint64_t current_timestamp();

  // ISO-8601, e.g. "5236-03-31T21:21:00.684697500Z"
  std::string format_instant(const Instant& instant);

  // Version 1 layout: time_low | time_mid | time_hi (version nibble left zero)
  constexpr uint64_t to_time_based_bits(uint64_t timestamp) {
    return ((timestamp & 0x00000000FFFFFFFFULL) << 32)
           | ((timestamp & 0x0000FFFF00000000ULL) >> 16)
           | ((timestamp & 0x0FFF000000000000ULL) >> 48);
  }

  constexpr uint64_t from_time_based_bits(uint64_t msb) {
    return ((msb & 0xFFFFFFFF00000000ULL) >> 32)
           | ((msb & 0x00000000FFFF0000ULL) << 16)
           | ((msb & 0x0000000000000FFFULL) << 48);
  }

  // Version 6 layout: high 48 bits first, low 12 bits after the version nibble
  constexpr uint64_t to_time_ordered_bits(uint64_t timestamp) {
    return ((timestamp & 0x0FFFFFFFFFFFF000ULL) << 4) | (timestamp & 0x0000000000000FFFULL);
  }

  constexpr uint64_t from_time_ordered_bits(uint64_t msb) {
    return ((msb & 0xFFFFFFFFFFFF0000ULL) >> 4) | (msb & 0x0000000000000FFFULL);
  }

}  // namespace uuidcraft::timestamp
