#include <fmt/format.h>
#include <uuidcraft/errors.h>
#include <uuidcraft/node_identifier.h>
#include <uuidcraft/uuid_util.h>

namespace uuidcraft::uuid_util {

  namespace {
    int version_nibble(const Uuid& uuid) {
      return static_cast<int>((uuid.most_significant_bits() & VERSION_MASK) >> 12);
    }

    void require_rfc4122(const Uuid& uuid, const char* field) {
      if (!is_rfc4122(uuid)) {
        throw InvalidFormatError(
            fmt::format("Cannot extract {} from {}: not an RFC 4122 variant", field, uuid.to_string()));
      }
    }

    [[noreturn]] void wrong_version(const Uuid& uuid, const char* field) {
      throw InvalidFormatError(fmt::format("Cannot extract {} from version {} UUID {}", field,
                                           version_nibble(uuid), uuid.to_string()));
    }

    void require_time_based(const Uuid& uuid, const char* field) {
      require_rfc4122(uuid, field);
      if (!is_time_based(uuid)) {
        wrong_version(uuid, field);
      }
    }

    void require_dce_security(const Uuid& uuid, const char* field) {
      require_rfc4122(uuid, field);
      if (extract_version(uuid) != UuidVersion::DCE_SECURITY) {
        wrong_version(uuid, field);
      }
    }
  }  // anonymous namespace

  UuidVariant extract_variant(const Uuid& uuid) {
    uint64_t top = uuid.least_significant_bits() >> 61;
    if ((top & 0x4) == 0) return UuidVariant::NCS;
    if ((top & 0x2) == 0) return UuidVariant::RFC4122;
    if ((top & 0x1) == 0) return UuidVariant::MICROSOFT;
    return UuidVariant::FUTURE;
  }

  bool is_rfc4122(const Uuid& uuid) { return extract_variant(uuid) == UuidVariant::RFC4122; }

  UuidVersion extract_version(const Uuid& uuid) {
    int version = version_nibble(uuid);
    if (version < 1 || version > 6) {
      return UuidVersion::UNKNOWN;
    }
    return static_cast<UuidVersion>(version);
  }

  bool is_time_based(const Uuid& uuid) {
    UuidVersion version = extract_version(uuid);
    return version == UuidVersion::TIME_BASED || version == UuidVersion::DCE_SECURITY
           || version == UuidVersion::TIME_ORDERED;
  }

  uint64_t extract_timestamp(const Uuid& uuid) {
    require_time_based(uuid, "timestamp");

    uint64_t msb = uuid.most_significant_bits();
    switch (extract_version(uuid)) {
      case UuidVersion::TIME_ORDERED:
        return timestamp::from_time_ordered_bits(msb);
      case UuidVersion::DCE_SECURITY:
        return timestamp::from_time_based_bits(msb) & 0xFFFFFFFF00000000ULL;
      default:
        return timestamp::from_time_based_bits(msb);
    }
  }

  timestamp::Instant extract_instant(const Uuid& uuid) {
    return timestamp::to_instant(extract_timestamp(uuid));
  }

  int64_t extract_unix_milliseconds(const Uuid& uuid) {
    return timestamp::to_unix_milliseconds(extract_timestamp(uuid));
  }

  uint16_t extract_clock_sequence(const Uuid& uuid) {
    require_time_based(uuid, "clock sequence");

    uint64_t lsb = uuid.least_significant_bits();
    if (extract_version(uuid) == UuidVersion::DCE_SECURITY) {
      return static_cast<uint16_t>((lsb >> 56) & 0x3F);
    }
    return static_cast<uint16_t>((lsb >> 48) & 0x3FFF);
  }

  uint64_t extract_node_identifier(const Uuid& uuid) {
    require_time_based(uuid, "node identifier");
    return uuid.least_significant_bits() & NODE_IDENTIFIER_MASK;
  }

  uint8_t extract_local_domain(const Uuid& uuid) {
    require_dce_security(uuid, "local domain");
    return static_cast<uint8_t>((uuid.least_significant_bits() >> 48) & 0xFF);
  }

  int32_t extract_local_identifier(const Uuid& uuid) {
    require_dce_security(uuid, "local identifier");
    return static_cast<int32_t>(static_cast<uint32_t>(uuid.most_significant_bits() >> 32));
  }

}  // namespace uuidcraft::uuid_util
