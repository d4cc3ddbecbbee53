#pragma once

#include <uuidcraft/dce_security.h>
#include <uuidcraft/uuid.h>

#include <cstdint>
#include <string>
#include <vector>

// Shortcuts backed by process-wide creators built on first use. All
// time-based ones share default_clock_sequence_controller().
namespace uuidcraft::uuid_creator {

  Uuid nil();

  // Version 4
  Uuid random_based();
  Uuid fast_random_based();

  // Version 1
  Uuid time_based();
  Uuid time_based_with_mac();

  // Version 6
  Uuid time_ordered();
  Uuid time_ordered_with_mac();

  // Version 3
  Uuid name_based_md5(const std::string& name);
  Uuid name_based_md5(const std::vector<uint8_t>& name);
  Uuid name_based_md5(const Uuid& name_space, const std::string& name);
  Uuid name_based_md5(const Uuid& name_space, const std::vector<uint8_t>& name);

  // Version 5
  Uuid name_based_sha1(const std::string& name);
  Uuid name_based_sha1(const std::vector<uint8_t>& name);
  Uuid name_based_sha1(const Uuid& name_space, const std::string& name);
  Uuid name_based_sha1(const Uuid& name_space, const std::vector<uint8_t>& name);

  // Version 2
  Uuid dce_security(LocalDomain local_domain, int32_t local_identifier);
  Uuid dce_security_with_mac(LocalDomain local_domain, int32_t local_identifier);

  // Non-standard
  Uuid comb_guid();
  Uuid alt_comb_guid();

}  // namespace uuidcraft::uuid_creator
