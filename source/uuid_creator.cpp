#include <uuidcraft/comb.h>
#include <uuidcraft/name_based.h>
#include <uuidcraft/random_based.h>
#include <uuidcraft/time_based.h>
#include <uuidcraft/uuid_creator.h>

namespace uuidcraft::uuid_creator {

  namespace {
    TimeBasedConfig default_time_config() {
      return TimeBasedConfig{}.with_controller(default_clock_sequence_controller());
    }

    RandomBasedUuidCreator& random_creator() {
      static RandomBasedUuidCreator creator;
      return creator;
    }

    RandomBasedUuidCreator& fast_random_creator() {
      static RandomBasedUuidCreator creator(RandomBasedConfig{RandomGenerator::FAST});
      return creator;
    }

    TimeBasedUuidCreator& time_based_creator() {
      static TimeBasedUuidCreator creator(default_time_config());
      return creator;
    }

    TimeBasedUuidCreator& time_based_mac_creator() {
      static TimeBasedUuidCreator creator(default_time_config().with_hardware_address());
      return creator;
    }

    TimeOrderedUuidCreator& time_ordered_creator() {
      static TimeOrderedUuidCreator creator(default_time_config());
      return creator;
    }

    TimeOrderedUuidCreator& time_ordered_mac_creator() {
      static TimeOrderedUuidCreator creator(default_time_config().with_hardware_address());
      return creator;
    }

    const NameBasedUuidCreator& md5_creator() {
      static const NameBasedUuidCreator creator(NameBasedConfig{NameHash::MD5, std::nullopt});
      return creator;
    }

    const NameBasedUuidCreator& sha1_creator() {
      static const NameBasedUuidCreator creator(NameBasedConfig{NameHash::SHA1, std::nullopt});
      return creator;
    }

    DceSecurityUuidCreator& dce_creator() {
      static DceSecurityUuidCreator creator(DceSecurityConfig{default_time_config(), std::nullopt});
      return creator;
    }

    DceSecurityUuidCreator& dce_mac_creator() {
      static DceSecurityUuidCreator creator(
          DceSecurityConfig{default_time_config().with_hardware_address(), std::nullopt});
      return creator;
    }

    CombGuidCreator& comb_creator() {
      static CombGuidCreator creator;
      return creator;
    }

    AltCombGuidCreator& alt_comb_creator() {
      static AltCombGuidCreator creator;
      return creator;
    }
  }  // anonymous namespace

  Uuid nil() { return Uuid::nil(); }

  Uuid random_based() { return random_creator().create(); }
  Uuid fast_random_based() { return fast_random_creator().create(); }

  Uuid time_based() { return time_based_creator().create(); }
  Uuid time_based_with_mac() { return time_based_mac_creator().create(); }

  Uuid time_ordered() { return time_ordered_creator().create(); }
  Uuid time_ordered_with_mac() { return time_ordered_mac_creator().create(); }

  Uuid name_based_md5(const std::string& name) { return md5_creator().create(name); }
  Uuid name_based_md5(const std::vector<uint8_t>& name) { return md5_creator().create(name); }
  Uuid name_based_md5(const Uuid& name_space, const std::string& name) {
    return md5_creator().create(name_space, name);
  }
  Uuid name_based_md5(const Uuid& name_space, const std::vector<uint8_t>& name) {
    return md5_creator().create(name_space, name);
  }

  Uuid name_based_sha1(const std::string& name) { return sha1_creator().create(name); }
  Uuid name_based_sha1(const std::vector<uint8_t>& name) { return sha1_creator().create(name); }
  Uuid name_based_sha1(const Uuid& name_space, const std::string& name) {
    return sha1_creator().create(name_space, name);
  }
  Uuid name_based_sha1(const Uuid& name_space, const std::vector<uint8_t>& name) {
    return sha1_creator().create(name_space, name);
  }

  Uuid dce_security(LocalDomain local_domain, int32_t local_identifier) {
    return dce_creator().create(local_domain, local_identifier);
  }

  Uuid dce_security_with_mac(LocalDomain local_domain, int32_t local_identifier) {
    return dce_mac_creator().create(local_domain, local_identifier);
  }

  Uuid comb_guid() { return comb_creator().create(); }
  Uuid alt_comb_guid() { return alt_comb_creator().create(); }

}  // namespace uuidcraft::uuid_creator
