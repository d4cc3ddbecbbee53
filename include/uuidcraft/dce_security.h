#pragma once

#include <uuidcraft/time_based.h>
#include <uuidcraft/uuid.h>

#include <cstdint>
#include <mutex>
#include <optional>

namespace uuidcraft {

  // Registered DCE local domains (sec_rgy_domain_t)
  enum class LocalDomain : uint8_t {
    PERSON = 0,  // POSIX UID domain
    GROUP = 1,   // POSIX GID domain
    ORG = 2,
  };

  // The clock_seq_hi_and_reserved counter wraps after this value
  constexpr uint8_t DCE_COUNTER_MAX = 63;

  // Turns a version 1 value into a version 2 value: time_low takes the local
  // identifier, clock_seq_low the local domain, clock_seq_hi_and_reserved the
  // 6-bit counter. Version and variant bits are rewritten.
  Uuid apply_dce_security(const Uuid& time_based, uint8_t local_domain, int32_t local_identifier,
                          uint8_t counter);

  struct DceSecurityConfig {
    TimeBasedConfig time_based;
    std::optional<LocalDomain> local_domain;  // used by create(int32_t)
  };

  // Version 2 creator. Wraps a version 1 creator that waits out clock
  // sequence overruns, and adds its own 6-bit counter because the version 2
  // clock only ticks every ~7 minutes.
  class DceSecurityUuidCreator {
  public:
    explicit DceSecurityUuidCreator(DceSecurityConfig config = {});

    Uuid create(uint8_t local_domain, int32_t local_identifier);
    Uuid create(LocalDomain local_domain, int32_t local_identifier);

    // Uses the configured local domain. Throws InvalidArgumentError if none.
    Uuid create(int32_t local_identifier);

    // Always throws UnsupportedOperationError: a domain and an identifier are required
    Uuid create();

    uint64_t node_identifier() const { return time_based_.node_identifier(); }

  private:
    TimeBasedUuidCreator time_based_;
    const std::optional<LocalDomain> local_domain_;
    std::mutex mutex_;
    uint8_t counter_ = 0;
  };

}  // namespace uuidcraft
