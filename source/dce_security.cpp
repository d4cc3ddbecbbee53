#include <uuidcraft/dce_security.h>
#include <uuidcraft/errors.h>

#include <utility>

namespace uuidcraft {

  namespace {
    TimeBasedConfig with_overrun_wait(TimeBasedConfig config) {
      config.suppress_overrun = true;
      return config;
    }
  }  // anonymous namespace

  Uuid apply_dce_security(const Uuid& time_based, uint8_t local_domain, int32_t local_identifier,
                          uint8_t counter) {
    uint64_t msb = (time_based.most_significant_bits() & 0x00000000FFFFFFFFULL)
                   | (static_cast<uint64_t>(static_cast<uint32_t>(local_identifier)) << 32);

    uint64_t lsb = (time_based.least_significant_bits() & 0x0000FFFFFFFFFFFFULL)
                   | (static_cast<uint64_t>(local_domain) << 48)
                   | (static_cast<uint64_t>(counter & DCE_COUNTER_MAX) << 56);

    return Uuid(apply_version_bits(msb, UuidVersion::DCE_SECURITY), apply_variant_bits(lsb));
  }

  DceSecurityUuidCreator::DceSecurityUuidCreator(DceSecurityConfig config)
      : time_based_(with_overrun_wait(std::move(config.time_based))),
        local_domain_(config.local_domain) {}

  Uuid DceSecurityUuidCreator::create(uint8_t local_domain, int32_t local_identifier) {
    std::lock_guard<std::mutex> lock(mutex_);

    Uuid uuid = time_based_.create();
    uint8_t counter = counter_;
    counter_ = counter_ >= DCE_COUNTER_MAX ? 0 : static_cast<uint8_t>(counter_ + 1);

    return apply_dce_security(uuid, local_domain, local_identifier, counter);
  }

  Uuid DceSecurityUuidCreator::create(LocalDomain local_domain, int32_t local_identifier) {
    return create(static_cast<uint8_t>(local_domain), local_identifier);
  }

  Uuid DceSecurityUuidCreator::create(int32_t local_identifier) {
    if (!local_domain_) {
      throw InvalidArgumentError("No local domain configured for DCE Security creator");
    }
    return create(*local_domain_, local_identifier);
  }

  Uuid DceSecurityUuidCreator::create() {
    throw UnsupportedOperationError("DCE Security UUIDs need a local domain and a local identifier");
  }

}  // namespace uuidcraft
