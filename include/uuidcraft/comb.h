#pragma once

#include <uuidcraft/creator.h>
#include <uuidcraft/uuid.h>

#include <cstdint>
#include <functional>

namespace uuidcraft {

  // Non-standard COMB identifiers: 48 bits of Unix milliseconds next to 80
  // random bits, marked as version 4 with the RFC 4122 variant.
  struct CombConfig {
    // Unix milliseconds; the system clock when empty
    std::function<int64_t()> clock;
  };

  // Milliseconds in the last 48 bits (SQL Server friendly ordering)
  class CombGuidCreator : public NoArgumentsUuidCreator {
  public:
    explicit CombGuidCreator(CombConfig config = {});
    Uuid create() override;

  private:
    std::function<int64_t()> clock_;
  };

  // Milliseconds in the first 48 bits (byte-order friendly ordering)
  class AltCombGuidCreator : public NoArgumentsUuidCreator {
  public:
    explicit AltCombGuidCreator(CombConfig config = {});
    Uuid create() override;

  private:
    std::function<int64_t()> clock_;
  };

}  // namespace uuidcraft
