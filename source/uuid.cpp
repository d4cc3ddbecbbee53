#include <fmt/format.h>
#include <uuidcraft/errors.h>
#include <uuidcraft/uuid.h>

namespace uuidcraft {

  namespace {
    // Offsets of the hyphens in the canonical form
    constexpr size_t HYPHENS[] = {8, 13, 18, 23};

    int hex_value(char c) {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    }

    bool is_hyphen_position(size_t i) {
      for (size_t h : HYPHENS) {
        if (i == h) return true;
      }
      return false;
    }
  }  // anonymous namespace

  Uuid Uuid::from_bytes(const uint8_t* bytes) {
    uint64_t msb = 0;
    uint64_t lsb = 0;
    for (size_t i = 0; i < 8; i++) {
      msb = (msb << 8) | bytes[i];
    }
    for (size_t i = 8; i < UUID_SIZE; i++) {
      lsb = (lsb << 8) | bytes[i];
    }
    return Uuid(msb, lsb);
  }

  Uuid Uuid::from_string(const std::string& text) {
    if (text.size() != UUID_STRING_LENGTH) {
      throw InvalidFormatError(fmt::format("Invalid UUID string length {}: \"{}\"", text.size(), text));
    }

    uint64_t msb = 0;
    uint64_t lsb = 0;
    size_t nibbles = 0;

    for (size_t i = 0; i < text.size(); i++) {
      if (is_hyphen_position(i)) {
        if (text[i] != '-') {
          throw InvalidFormatError(fmt::format("Expected '-' at offset {}: \"{}\"", i, text));
        }
        continue;
      }

      int value = hex_value(text[i]);
      if (value < 0) {
        throw InvalidFormatError(fmt::format("Invalid hex digit at offset {}: \"{}\"", i, text));
      }

      if (nibbles < 16) {
        msb = (msb << 4) | static_cast<uint64_t>(value);
      } else {
        lsb = (lsb << 4) | static_cast<uint64_t>(value);
      }
      nibbles++;
    }

    return Uuid(msb, lsb);
  }

  UuidBytes Uuid::to_bytes() const {
    UuidBytes bytes{};
    for (size_t i = 0; i < 8; i++) {
      bytes[i] = static_cast<uint8_t>(msb_ >> (56 - i * 8));
      bytes[i + 8] = static_cast<uint8_t>(lsb_ >> (56 - i * 8));
    }
    return bytes;
  }

  std::string Uuid::to_string() const {
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", msb_ >> 32, (msb_ >> 16) & 0xFFFF,
                       msb_ & 0xFFFF, lsb_ >> 48, lsb_ & 0xFFFFFFFFFFFFULL);
  }

  std::ostream& operator<<(std::ostream& os, const Uuid& uuid) { return os << uuid.to_string(); }

}  // namespace uuidcraft
