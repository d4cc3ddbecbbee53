#include <fmt/format.h>
#include <uuidcraft/clock_sequence.h>
#include <uuidcraft/crypto.h>
#include <uuidcraft/errors.h>

#include <utility>

namespace uuidcraft {

  namespace {
    uint16_t random_clock_sequence() {
      return static_cast<uint16_t>(crypto::random_u64() & CLOCK_SEQUENCE_MAX);
    }
  }  // anonymous namespace

  ClockSequenceController::ClockSequenceController(ClockSequencePolicy policy) : policy_(policy) {}

  size_t ClockSequenceController::slot_index(uint64_t node_identifier) {
    // splitmix64 finalizer, so neighbouring node identifiers spread out
    uint64_t z = node_identifier + 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    z = z ^ (z >> 31);
    return static_cast<size_t>(z % POOL_SIZE);
  }

  bool ClockSequenceController::can_step(const Slot& slot, uint64_t timestamp) {
    uint64_t chunk = (slot.steps + 1) / STEP_CHUNK;
    if (chunk < MARK_COUNT) {
      // No wrap yet in this walk
      return !slot.bounded || timestamp > slot.floor;
    }
    // The value about to be reused was last issued before the walk entered
    // chunk - (MARK_COUNT - 1)
    return timestamp > slot.marks[(chunk - (MARK_COUNT - 1)) % MARK_COUNT];
  }

  std::optional<uint16_t> ClockSequenceController::try_next(uint64_t timestamp,
                                                            uint64_t node_identifier) {
    Slot& slot = slots_[slot_index(node_identifier)];
    std::lock_guard<std::mutex> lock(slot.mutex);

    if (!slot.used) {
      slot.used = true;
      slot.last_timestamp = timestamp;
      slot.clock_sequence = random_clock_sequence();
      slot.steps = 0;
      return slot.clock_sequence;
    }

    if (timestamp <= slot.last_timestamp) {
      // Repeated or regressed timestamp
      if (!can_step(slot, timestamp)) {
        return std::nullopt;
      }
      slot.steps++;
      if (slot.steps % STEP_CHUNK == 0) {
        slot.marks[(slot.steps / STEP_CHUNK) % MARK_COUNT] = slot.last_timestamp;
      }
      slot.clock_sequence = static_cast<uint16_t>((slot.clock_sequence + 1) & CLOCK_SEQUENCE_MAX);
      return slot.clock_sequence;
    }

    if (policy_ == ClockSequencePolicy::RESEED) {
      slot.bounded = true;
      slot.floor = slot.last_timestamp;
      slot.steps = 0;
      slot.clock_sequence = random_clock_sequence();
    }
    slot.last_timestamp = timestamp;
    return slot.clock_sequence;
  }

  uint16_t ClockSequenceController::next(uint64_t timestamp, uint64_t node_identifier) {
    auto clock_sequence = try_next(timestamp, node_identifier);
    if (!clock_sequence) {
      throw OverrunError(fmt::format(
          "Clock sequence overrun for timestamp {} and node {:012x}", timestamp, node_identifier));
    }
    return *clock_sequence;
  }

  void ClockSequenceController::clear_pool() {
    for (Slot& slot : slots_) {
      std::lock_guard<std::mutex> lock(slot.mutex);
      slot.used = false;
      slot.last_timestamp = 0;
      slot.clock_sequence = 0;
      slot.steps = 0;
      slot.marks.fill(0);
      slot.bounded = false;
      slot.floor = 0;
    }
  }

  std::shared_ptr<ClockSequenceController> default_clock_sequence_controller() {
    static const auto controller = std::make_shared<ClockSequenceController>();
    return controller;
  }

  DefaultClockSequenceStrategy::DefaultClockSequenceStrategy(
      std::shared_ptr<ClockSequenceController> controller)
      : controller_(std::move(controller)) {
    if (!controller_) {
      throw InvalidArgumentError("Null clock sequence controller");
    }
  }

  std::optional<uint16_t> DefaultClockSequenceStrategy::next(uint64_t timestamp,
                                                             uint64_t node_identifier) {
    return controller_->try_next(timestamp, node_identifier);
  }

}  // namespace uuidcraft
