#pragma once

#include <uuidcraft/timestamp.h>
#include <uuidcraft/uuid.h>

#include <cstdint>

namespace uuidcraft {

  // Variant families, by the top bits of byte 8
  enum class UuidVariant {
    NCS,        // 0xx
    RFC4122,    // 10x
    MICROSOFT,  // 110
    FUTURE,     // 111
  };

  // Field extraction. Every function that reads a version-specific field
  // throws InvalidFormatError when the UUID is not RFC 4122 or its version
  // does not carry that field.
  namespace uuid_util {

    UuidVariant extract_variant(const Uuid& uuid);
    bool is_rfc4122(const Uuid& uuid);

    // Version nibble as stored; UNKNOWN for values outside 1-6
    UuidVersion extract_version(const Uuid& uuid);

    // Versions 1, 2 and 6
    bool is_time_based(const Uuid& uuid);

    // Versions 1 and 6 give the full 60 bits. Version 2 gives the timestamp
    // with its low 32 bits zeroed, since time_low holds the local identifier.
    uint64_t extract_timestamp(const Uuid& uuid);
    timestamp::Instant extract_instant(const Uuid& uuid);
    int64_t extract_unix_milliseconds(const Uuid& uuid);

    // 14 bits for versions 1 and 6, the 6-bit counter for version 2
    uint16_t extract_clock_sequence(const Uuid& uuid);

    // Versions 1, 2 and 6
    uint64_t extract_node_identifier(const Uuid& uuid);

    // Version 2 only
    uint8_t extract_local_domain(const Uuid& uuid);
    int32_t extract_local_identifier(const Uuid& uuid);

  }  // namespace uuid_util

}  // namespace uuidcraft
