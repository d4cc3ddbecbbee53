#pragma once

#include <uuidcraft/timestamp.h>

#include <cstdint>
#include <functional>
#include <mutex>

namespace uuidcraft {

  // Supplies the 60-bit timestamp for time-based creators
  class TimestampSource {
  public:
    virtual ~TimestampSource() = default;
    virtual uint64_t timestamp() = 0;
  };

  // System clock at millisecond resolution plus a per-millisecond counter.
  // The counter restarts at a random offset below COUNTER_OFFSET_MAX every
  // millisecond and advances on each call, so successive values from one
  // source are strictly increasing while the clock moves forward. When all
  // 10000 ticks of a millisecond are used the call waits for the next one.
  class SystemTimestampSource : public TimestampSource {
  public:
    static constexpr uint32_t COUNTER_OFFSET_MAX = 256;

    // Clock override returning Unix milliseconds, for tests
    using MillisClock = std::function<int64_t()>;

    SystemTimestampSource();
    explicit SystemTimestampSource(MillisClock clock);

    uint64_t timestamp() override;

  private:
    MillisClock clock_;
    std::mutex mutex_;
    int64_t last_millis_ = 0;
    uint32_t counter_ = 0;
    bool started_ = false;
  };

  // Always returns the same timestamp
  class FixedTimestampSource : public TimestampSource {
  public:
    explicit FixedTimestampSource(uint64_t timestamp)
        : timestamp_(timestamp & timestamp::TIMESTAMP_MASK) {}
    explicit FixedTimestampSource(const timestamp::Instant& instant)
        : timestamp_(timestamp::to_timestamp(instant)) {}

    uint64_t timestamp() override { return timestamp_; }

  private:
    const uint64_t timestamp_;
  };

}  // namespace uuidcraft
