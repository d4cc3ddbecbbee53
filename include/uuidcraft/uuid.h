#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace uuidcraft {

  constexpr size_t UUID_SIZE = 16;
  constexpr size_t UUID_STRING_LENGTH = 36;

  using UuidBytes = std::array<uint8_t, UUID_SIZE>;

  // RFC 4122 versions handled by the library
  enum class UuidVersion : int {
    UNKNOWN = 0,
    TIME_BASED = 1,
    DCE_SECURITY = 2,
    NAME_BASED_MD5 = 3,
    RANDOM_BASED = 4,
    NAME_BASED_SHA1 = 5,
    TIME_ORDERED = 6,
  };

  // Immutable 128-bit identifier stored as two big-endian 64-bit words
  class Uuid {
  public:
    constexpr Uuid() = default;
    constexpr Uuid(uint64_t msb, uint64_t lsb) : msb_(msb), lsb_(lsb) {}

    static Uuid from_bytes(const uint8_t* bytes);
    static Uuid from_bytes(const UuidBytes& bytes) { return from_bytes(bytes.data()); }

    // Parses the canonical 8-4-4-4-12 form, upper or lower case hex.
    // Throws InvalidFormatError on anything else.
    static Uuid from_string(const std::string& text);

    static constexpr Uuid nil() { return Uuid(); }

    constexpr uint64_t most_significant_bits() const { return msb_; }
    constexpr uint64_t least_significant_bits() const { return lsb_; }
    constexpr bool is_nil() const { return msb_ == 0 && lsb_ == 0; }

    UuidBytes to_bytes() const;

    // Lowercase canonical form, 36 characters
    std::string to_string() const;

    friend constexpr bool operator==(const Uuid& a, const Uuid& b) {
      return a.msb_ == b.msb_ && a.lsb_ == b.lsb_;
    }
    friend constexpr bool operator!=(const Uuid& a, const Uuid& b) { return !(a == b); }

    // Unsigned lexicographic order, same as comparing the 16 bytes
    friend constexpr bool operator<(const Uuid& a, const Uuid& b) {
      return a.msb_ < b.msb_ || (a.msb_ == b.msb_ && a.lsb_ < b.lsb_);
    }
    friend constexpr bool operator>(const Uuid& a, const Uuid& b) { return b < a; }
    friend constexpr bool operator<=(const Uuid& a, const Uuid& b) { return !(b < a); }
    friend constexpr bool operator>=(const Uuid& a, const Uuid& b) { return !(a < b); }

  private:
    uint64_t msb_ = 0;
    uint64_t lsb_ = 0;
  };

  std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

  // Bit helpers shared by the creators
  constexpr uint64_t VERSION_MASK = 0x000000000000F000ULL;
  constexpr uint64_t VARIANT_MASK = 0xC000000000000000ULL;
  constexpr uint64_t VARIANT_RFC4122 = 0x8000000000000000ULL;

  constexpr uint64_t apply_version_bits(uint64_t msb, UuidVersion version) {
    return (msb & ~VERSION_MASK) | (static_cast<uint64_t>(version) << 12);
  }

  constexpr uint64_t apply_variant_bits(uint64_t lsb) {
    return (lsb & ~VARIANT_MASK) | VARIANT_RFC4122;
  }

}  // namespace uuidcraft

namespace std {
  template <> struct hash<uuidcraft::Uuid> {
    size_t operator()(const uuidcraft::Uuid& uuid) const noexcept {
      uint64_t h = uuid.most_significant_bits() ^ (uuid.least_significant_bits() * 0x9E3779B97F4A7C15ULL);
      return std::hash<uint64_t>{}(h);
    }
  };
}  // namespace std
