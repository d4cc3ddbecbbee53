#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace uuidcraft {

  constexpr uint16_t CLOCK_SEQUENCE_MAX = 0x3FFF;
  constexpr uint32_t CLOCK_SEQUENCE_COUNT = CLOCK_SEQUENCE_MAX + 1;  // 16384

  // What a slot does with its clock sequence when the timestamp advances
  enum class ClockSequencePolicy {
    KEEP,    // keep the current value
    RESEED,  // draw a new random value
  };

  // Hands out clock sequences so that no (timestamp, node, clock sequence)
  // triple is issued twice. State is split into slots selected from the node
  // identifier; each slot is guarded by its own mutex.
  //
  // One instance is meant to be shared by every creator of a process (or of a
  // test). Creators hold it through DefaultClockSequenceStrategy.
  class ClockSequenceController {
  public:
    static constexpr size_t POOL_SIZE = 64;

    explicit ClockSequenceController(ClockSequencePolicy policy = ClockSequencePolicy::KEEP);

    ClockSequenceController(const ClockSequenceController&) = delete;
    ClockSequenceController& operator=(const ClockSequenceController&) = delete;

    // Next clock sequence for the pair. A repeated or regressed timestamp
    // steps the sequence on; an advanced one keeps it (or reseeds it). Throws
    // OverrunError when the step would wrap onto a value that may already have
    // been issued at a timestamp no later than this one.
    uint16_t next(uint64_t timestamp, uint64_t node_identifier);

    // Same as next(), but reports an overrun as an empty optional and leaves
    // the slot unchanged.
    std::optional<uint16_t> try_next(uint64_t timestamp, uint64_t node_identifier);

    // Forget every slot. Meant for test isolation.
    void clear_pool();

    ClockSequencePolicy policy() const { return policy_; }

    static size_t slot_index(uint64_t node_identifier);

  private:
    // Steps are grouped in chunks of STEP_CHUNK. marks[c % MARK_COUNT] holds
    // the highest timestamp seen when the walk entered chunk c, which bounds
    // the timestamps of every value issued before it.
    static constexpr uint64_t STEP_CHUNK = 1024;
    static constexpr size_t MARK_COUNT = CLOCK_SEQUENCE_COUNT / STEP_CHUNK;

    struct Slot {
      std::mutex mutex;
      bool used = false;
      uint64_t last_timestamp = 0;  // highest timestamp seen
      uint16_t clock_sequence = 0;
      uint64_t steps = 0;  // increments since the last seed
      std::array<uint64_t, MARK_COUNT> marks{};
      // Set by a reseed: every earlier value was issued at or before floor
      bool bounded = false;
      uint64_t floor = 0;
    };

    static bool can_step(const Slot& slot, uint64_t timestamp);

    const ClockSequencePolicy policy_;
    std::array<Slot, POOL_SIZE> slots_;
  };

  // Controller shared by every creator that is not given one explicitly.
  // Built on first use and kept for the life of the process.
  std::shared_ptr<ClockSequenceController> default_clock_sequence_controller();

  // Clock sequence supplier used by time-based creators
  class ClockSequenceStrategy {
  public:
    virtual ~ClockSequenceStrategy() = default;

    // Empty on overrun
    virtual std::optional<uint16_t> next(uint64_t timestamp, uint64_t node_identifier) = 0;
  };

  // Delegates to a shared controller
  class DefaultClockSequenceStrategy : public ClockSequenceStrategy {
  public:
    explicit DefaultClockSequenceStrategy(std::shared_ptr<ClockSequenceController> controller);

    std::optional<uint16_t> next(uint64_t timestamp, uint64_t node_identifier) override;

    const std::shared_ptr<ClockSequenceController>& controller() const { return controller_; }

  private:
    std::shared_ptr<ClockSequenceController> controller_;
  };

  // Constant clock sequence. Uniqueness then depends on the timestamps alone.
  class FixedClockSequenceStrategy : public ClockSequenceStrategy {
  public:
    explicit FixedClockSequenceStrategy(uint16_t clock_sequence)
        : clock_sequence_(clock_sequence & CLOCK_SEQUENCE_MAX) {}

    std::optional<uint16_t> next(uint64_t, uint64_t) override { return clock_sequence_; }

  private:
    const uint16_t clock_sequence_;
  };

}  // namespace uuidcraft
