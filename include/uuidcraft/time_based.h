#pragma once

#include <uuidcraft/clock_sequence.h>
#include <uuidcraft/creator.h>
#include <uuidcraft/node_identifier.h>
#include <uuidcraft/timestamp_source.h>
#include <uuidcraft/uuid.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>

namespace uuidcraft {

  // Time-based creator configuration, fixed at construction.
  // Null members are replaced by the defaults noted beside them.
  struct TimeBasedConfig {
    std::shared_ptr<TimestampSource> timestamp_source;            // SystemTimestampSource
    std::shared_ptr<NodeIdentifierSource> node_identifier_source;  // RandomNodeIdentifierSource
    std::shared_ptr<ClockSequenceStrategy> clock_sequence_strategy;  // controller below
    std::shared_ptr<ClockSequenceController> clock_sequence_controller;  // process-wide one

    // On overrun, retry with a fresh timestamp instead of throwing at once.
    // Gives up with OverrunError after overrun_retries attempts.
    bool suppress_overrun = false;
    uint32_t overrun_retries = 1024;
    std::chrono::microseconds overrun_backoff{1};

    TimeBasedConfig with_fixed_timestamp(uint64_t timestamp) const;
    TimeBasedConfig with_fixed_timestamp(const timestamp::Instant& instant) const;
    TimeBasedConfig with_fixed_node_identifier(uint64_t node_identifier,
                                               bool multicast = false) const;
    TimeBasedConfig with_hardware_address() const;
    TimeBasedConfig with_controller(std::shared_ptr<ClockSequenceController> controller) const;
    TimeBasedConfig without_overrun_exception() const;
  };

  // Shared machinery of the version 1 and version 6 creators. Subclasses
  // decide where the timestamp bits go in the most significant word.
  class AbstractTimeBasedUuidCreator : public NoArgumentsUuidCreator {
  public:
    Uuid create() override;

    UuidVersion version() const { return version_; }
    uint64_t node_identifier() const { return node_source_->node_identifier(); }
    const TimeBasedConfig& config() const { return config_; }

  protected:
    AbstractTimeBasedUuidCreator(UuidVersion version, TimeBasedConfig config);

    virtual uint64_t format_timestamp(uint64_t timestamp) const = 0;

  private:
    uint16_t next_clock_sequence(uint64_t& timestamp, uint64_t node_identifier);

    const UuidVersion version_;
    TimeBasedConfig config_;
    std::shared_ptr<TimestampSource> timestamp_source_;
    std::shared_ptr<NodeIdentifierSource> node_source_;
    std::shared_ptr<ClockSequenceStrategy> clock_sequence_;
  };

  // Version 1
  class TimeBasedUuidCreator final : public AbstractTimeBasedUuidCreator {
  public:
    explicit TimeBasedUuidCreator(TimeBasedConfig config = {})
        : AbstractTimeBasedUuidCreator(UuidVersion::TIME_BASED, std::move(config)) {}

  protected:
    uint64_t format_timestamp(uint64_t timestamp) const override;
  };

  // Version 6: same fields as version 1 with the timestamp stored most
  // significant part first, so byte order follows creation order
  class TimeOrderedUuidCreator final : public AbstractTimeBasedUuidCreator {
  public:
    explicit TimeOrderedUuidCreator(TimeBasedConfig config = {})
        : AbstractTimeBasedUuidCreator(UuidVersion::TIME_ORDERED, std::move(config)) {}

  protected:
    uint64_t format_timestamp(uint64_t timestamp) const override;
  };

}  // namespace uuidcraft
