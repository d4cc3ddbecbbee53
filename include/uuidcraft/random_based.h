#pragma once

#include <uuidcraft/creator.h>
#include <uuidcraft/uuid.h>

namespace uuidcraft {

  enum class RandomGenerator {
    SECURE,  // OpenSSL RAND_bytes
    FAST,    // thread-local Mersenne Twister
  };

  struct RandomBasedConfig {
    RandomGenerator generator = RandomGenerator::SECURE;
  };

  // Version 4
  class RandomBasedUuidCreator : public NoArgumentsUuidCreator {
  public:
    explicit RandomBasedUuidCreator(RandomBasedConfig config = {}) : config_(config) {}

    Uuid create() override;

  private:
    const RandomBasedConfig config_;
  };

}  // namespace uuidcraft
