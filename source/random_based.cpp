#include <uuidcraft/crypto.h>
#include <uuidcraft/random_based.h>

namespace uuidcraft {

  Uuid RandomBasedUuidCreator::create() {
    uint64_t msb = 0;
    uint64_t lsb = 0;

    if (config_.generator == RandomGenerator::FAST) {
      msb = crypto::fast_random_u64();
      lsb = crypto::fast_random_u64();
    } else {
      uint8_t bytes[UUID_SIZE];
      crypto::random_bytes(bytes, sizeof(bytes));
      Uuid raw = Uuid::from_bytes(bytes);
      msb = raw.most_significant_bits();
      lsb = raw.least_significant_bits();
    }

    return Uuid(apply_version_bits(msb, UuidVersion::RANDOM_BASED), apply_variant_bits(lsb));
  }

}  // namespace uuidcraft
