#pragma once

#include <uuidcraft/uuid.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uuidcraft {

  // Namespaces from RFC 4122 appendix C
  namespace namespaces {
    constexpr Uuid DNS(0x6ba7b8109dad11d1ULL, 0x80b400c04fd430c8ULL);
    constexpr Uuid URL(0x6ba7b8119dad11d1ULL, 0x80b400c04fd430c8ULL);
    constexpr Uuid OID(0x6ba7b8129dad11d1ULL, 0x80b400c04fd430c8ULL);
    constexpr Uuid X500(0x6ba7b8149dad11d1ULL, 0x80b400c04fd430c8ULL);
  }  // namespace namespaces

  enum class NameHash {
    MD5,   // version 3
    SHA1,  // version 5
  };

  struct NameBasedConfig {
    NameHash hash = NameHash::SHA1;
    std::optional<Uuid> name_space;  // used by the overloads without a namespace
  };

  // Versions 3 and 5: hash of the namespace bytes followed by the name bytes.
  // Without a namespace only the name is hashed.
  class NameBasedUuidCreator {
  public:
    explicit NameBasedUuidCreator(NameBasedConfig config = {}) : config_(config) {}

    Uuid create(const Uuid& name_space, const std::vector<uint8_t>& name) const;
    Uuid create(const Uuid& name_space, const std::string& name) const;

    // Use the configured namespace, if any
    Uuid create(const std::vector<uint8_t>& name) const;
    Uuid create(const std::string& name) const;

    UuidVersion version() const;

  private:
    Uuid hash(const std::optional<Uuid>& name_space, const uint8_t* name, size_t len) const;

    const NameBasedConfig config_;
  };

}  // namespace uuidcraft
