#include <fmt/format.h>
#include <uuidcraft/timestamp.h>

namespace uuidcraft::timestamp {

  namespace {
    constexpr int64_t SECONDS_PER_DAY = 86400;
    constexpr int64_t NANOS_PER_SECOND = 1000000000;
    constexpr int64_t NANOS_PER_TICK = 100;

    int64_t floor_div(int64_t a, int64_t b) {
      int64_t q = a / b;
      if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
      return q;
    }

    // Proleptic Gregorian date from days since 1970-01-01 (H. Hinnant's civil_from_days)
    void civil_from_days(int64_t days, int64_t& year, unsigned& month, unsigned& day) {
      days += 719468;
      const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
      const auto doe = static_cast<unsigned>(days - era * 146097);
      const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
      const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
      const unsigned mp = (5 * doy + 2) / 153;
      day = doy - (153 * mp + 2) / 5 + 1;
      month = mp < 10 ? mp + 3 : mp - 9;
      year = static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
    }
  }  // anonymous namespace

  uint64_t to_timestamp(const Instant& instant) {
    int64_t ticks = (instant.seconds - GREGORIAN_EPOCH_SECONDS) * static_cast<int64_t>(TICKS_PER_SECOND)
                    + instant.nanos / NANOS_PER_TICK;
    return static_cast<uint64_t>(ticks) & TIMESTAMP_MASK;
  }

  Instant to_instant(uint64_t timestamp) {
    timestamp &= TIMESTAMP_MASK;
    Instant instant;
    instant.seconds = static_cast<int64_t>(timestamp / TICKS_PER_SECOND) + GREGORIAN_EPOCH_SECONDS;
    instant.nanos = static_cast<uint32_t>((timestamp % TICKS_PER_SECOND) * NANOS_PER_TICK);
    return instant;
  }

  Instant from_time_point(std::chrono::system_clock::time_point tp) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    Instant instant;
    instant.seconds = floor_div(nanos, NANOS_PER_SECOND);
    instant.nanos = static_cast<uint32_t>(nanos - instant.seconds * NANOS_PER_SECOND);
    return instant;
  }

  uint64_t to_timestamp(std::chrono::system_clock::time_point tp) {
    return to_timestamp(from_time_point(tp));
  }

  uint64_t from_unix_milliseconds(int64_t millis) {
    int64_t ticks = (millis - GREGORIAN_EPOCH_SECONDS * 1000) * static_cast<int64_t>(TICKS_PER_MILLI);
    return static_cast<uint64_t>(ticks) & TIMESTAMP_MASK;
  }

  int64_t to_unix_milliseconds(uint64_t timestamp) {
    return static_cast<int64_t>((timestamp & TIMESTAMP_MASK) / TICKS_PER_MILLI)
           + GREGORIAN_EPOCH_SECONDS * 1000;
  }

  int64_t current_unix_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }

  uint64_t current_timestamp() { return to_timestamp(std::chrono::system_clock::now()); }

  std::string format_instant(const Instant& instant) {
    int64_t days = floor_div(instant.seconds, SECONDS_PER_DAY);
    int64_t secs = instant.seconds - days * SECONDS_PER_DAY;

    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:09d}Z", year, month, day,
                       secs / 3600, (secs % 3600) / 60, secs % 60, instant.nanos);
  }

}  // namespace uuidcraft::timestamp
