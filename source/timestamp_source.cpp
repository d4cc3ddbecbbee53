#include <fmt/format.h>
#include <uuidcraft/crypto.h>
#include <uuidcraft/errors.h>
#include <uuidcraft/timestamp_source.h>

#include <chrono>
#include <thread>

namespace uuidcraft {

  namespace {
    // How long to wait for the clock to leave a saturated millisecond
    constexpr int CLOCK_WAIT_ATTEMPTS = 10000;
    constexpr auto CLOCK_WAIT_STEP = std::chrono::microseconds(100);

    uint32_t random_counter_offset() {
      return static_cast<uint32_t>(crypto::random_u64() % SystemTimestampSource::COUNTER_OFFSET_MAX);
    }
  }  // anonymous namespace

  SystemTimestampSource::SystemTimestampSource()
      : SystemTimestampSource(timestamp::current_unix_milliseconds) {}

  SystemTimestampSource::SystemTimestampSource(MillisClock clock) : clock_(std::move(clock)) {}

  uint64_t SystemTimestampSource::timestamp() {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t millis = clock_();

    if (started_ && millis == last_millis_) {
      if (counter_ + 1 >= timestamp::TICKS_PER_MILLI) {
        // Millisecond exhausted, wait for the clock to move
        int attempts = 0;
        while (millis == last_millis_) {
          if (++attempts > CLOCK_WAIT_ATTEMPTS) {
            throw OverrunError(
                fmt::format("Clock stuck at {} ms after {} timestamps", millis, timestamp::TICKS_PER_MILLI));
          }
          std::this_thread::sleep_for(CLOCK_WAIT_STEP);
          millis = clock_();
        }
      } else {
        counter_++;
        return timestamp::from_unix_milliseconds(millis) + counter_;
      }
    }

    // New millisecond, or the clock moved backwards: restart the counter.
    // A regressed clock is left to the clock sequence to disambiguate.
    started_ = true;
    last_millis_ = millis;
    counter_ = random_counter_offset();
    return timestamp::from_unix_milliseconds(millis) + counter_;
  }

}  // namespace uuidcraft
