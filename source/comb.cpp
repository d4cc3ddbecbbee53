#include <uuidcraft/comb.h>
#include <uuidcraft/crypto.h>
#include <uuidcraft/timestamp.h>

#include <utility>

namespace uuidcraft {

  namespace {
    constexpr uint64_t MILLIS_MASK = 0x0000FFFFFFFFFFFFULL;

    std::function<int64_t()> clock_or_default(std::function<int64_t()> clock) {
      if (clock) return clock;
      return timestamp::current_unix_milliseconds;
    }

    // 80 random bits: the first 16 of hi, all of lo
    void random_80(uint64_t& hi, uint64_t& lo) {
      uint8_t bytes[10];
      crypto::random_bytes(bytes, sizeof(bytes));
      hi = (static_cast<uint64_t>(bytes[0]) << 8) | bytes[1];
      lo = 0;
      for (size_t i = 2; i < sizeof(bytes); i++) {
        lo = (lo << 8) | bytes[i];
      }
    }
  }  // anonymous namespace

  CombGuidCreator::CombGuidCreator(CombConfig config)
      : clock_(clock_or_default(std::move(config.clock))) {}

  Uuid CombGuidCreator::create() {
    uint64_t millis = static_cast<uint64_t>(clock_()) & MILLIS_MASK;

    uint64_t hi = 0;
    uint64_t lo = 0;
    random_80(hi, lo);

    // random(80) | millis(48)
    uint64_t msb = (hi << 48) | (lo >> 16);
    uint64_t lsb = (lo << 48) | millis;

    return Uuid(apply_version_bits(msb, UuidVersion::RANDOM_BASED), apply_variant_bits(lsb));
  }

  AltCombGuidCreator::AltCombGuidCreator(CombConfig config)
      : clock_(clock_or_default(std::move(config.clock))) {}

  Uuid AltCombGuidCreator::create() {
    uint64_t millis = static_cast<uint64_t>(clock_()) & MILLIS_MASK;

    uint64_t hi = 0;
    uint64_t lo = 0;
    random_80(hi, lo);

    // millis(48) | random(80)
    uint64_t msb = (millis << 16) | hi;
    uint64_t lsb = lo;

    return Uuid(apply_version_bits(msb, UuidVersion::RANDOM_BASED), apply_variant_bits(lsb));
  }

}  // namespace uuidcraft
