#include <fmt/format.h>
#include <uuidcraft/errors.h>
#include <uuidcraft/time_based.h>

#include <thread>

namespace uuidcraft {

  TimeBasedConfig TimeBasedConfig::with_fixed_timestamp(uint64_t timestamp) const {
    TimeBasedConfig config = *this;
    config.timestamp_source = std::make_shared<FixedTimestampSource>(timestamp);
    return config;
  }

  TimeBasedConfig TimeBasedConfig::with_fixed_timestamp(const timestamp::Instant& instant) const {
    TimeBasedConfig config = *this;
    config.timestamp_source = std::make_shared<FixedTimestampSource>(instant);
    return config;
  }

  TimeBasedConfig TimeBasedConfig::with_fixed_node_identifier(uint64_t node_identifier,
                                                              bool multicast) const {
    TimeBasedConfig config = *this;
    config.node_identifier_source
        = std::make_shared<FixedNodeIdentifierSource>(node_identifier, multicast);
    return config;
  }

  TimeBasedConfig TimeBasedConfig::with_hardware_address() const {
    TimeBasedConfig config = *this;
    config.node_identifier_source = std::make_shared<HardwareAddressNodeIdentifierSource>();
    return config;
  }

  TimeBasedConfig TimeBasedConfig::with_controller(
      std::shared_ptr<ClockSequenceController> controller) const {
    TimeBasedConfig config = *this;
    config.clock_sequence_controller = std::move(controller);
    return config;
  }

  TimeBasedConfig TimeBasedConfig::without_overrun_exception() const {
    TimeBasedConfig config = *this;
    config.suppress_overrun = true;
    return config;
  }

  AbstractTimeBasedUuidCreator::AbstractTimeBasedUuidCreator(UuidVersion version,
                                                             TimeBasedConfig config)
      : version_(version), config_(std::move(config)) {
    timestamp_source_ = config_.timestamp_source;
    if (!timestamp_source_) {
      timestamp_source_ = std::make_shared<SystemTimestampSource>();
    }

    node_source_ = config_.node_identifier_source;
    if (!node_source_) {
      node_source_ = std::make_shared<RandomNodeIdentifierSource>();
    }

    clock_sequence_ = config_.clock_sequence_strategy;
    if (!clock_sequence_) {
      auto controller = config_.clock_sequence_controller;
      if (!controller) {
        controller = default_clock_sequence_controller();
      }
      clock_sequence_ = std::make_shared<DefaultClockSequenceStrategy>(std::move(controller));
    }
  }

  uint16_t AbstractTimeBasedUuidCreator::next_clock_sequence(uint64_t& timestamp,
                                                             uint64_t node_identifier) {
    auto clock_sequence = clock_sequence_->next(timestamp, node_identifier);
    if (clock_sequence) {
      return *clock_sequence;
    }

    if (!config_.suppress_overrun) {
      throw OverrunError(fmt::format("Clock sequence overrun at timestamp {}", timestamp));
    }

    // Wait for the timestamp to move on, up to overrun_retries times
    for (uint32_t attempt = 0; attempt < config_.overrun_retries; attempt++) {
      std::this_thread::sleep_for(config_.overrun_backoff);
      timestamp = timestamp_source_->timestamp();
      clock_sequence = clock_sequence_->next(timestamp, node_identifier);
      if (clock_sequence) {
        return *clock_sequence;
      }
    }

    throw OverrunError(fmt::format("Clock sequence overrun at timestamp {}, gave up after {} retries",
                                   timestamp, config_.overrun_retries));
  }

  Uuid AbstractTimeBasedUuidCreator::create() {
    uint64_t timestamp = timestamp_source_->timestamp();
    uint64_t node_identifier = node_source_->node_identifier() & NODE_IDENTIFIER_MASK;
    uint16_t clock_sequence = next_clock_sequence(timestamp, node_identifier);

    uint64_t msb = apply_version_bits(format_timestamp(timestamp), version_);
    uint64_t lsb = apply_variant_bits((static_cast<uint64_t>(clock_sequence) << 48) | node_identifier);

    return Uuid(msb, lsb);
  }

  uint64_t TimeBasedUuidCreator::format_timestamp(uint64_t timestamp) const {
    return timestamp::to_time_based_bits(timestamp);
  }

  uint64_t TimeOrderedUuidCreator::format_timestamp(uint64_t timestamp) const {
    return timestamp::to_time_ordered_bits(timestamp);
  }

}  // namespace uuidcraft
