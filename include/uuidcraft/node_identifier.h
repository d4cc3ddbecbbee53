#pragma once

#include <cstdint>
#include <optional>

namespace uuidcraft {

  constexpr uint64_t NODE_IDENTIFIER_MASK = 0x0000FFFFFFFFFFFFULL;

  // Least significant bit of the first octet (RFC 4122 section 4.5)
  constexpr uint64_t MULTICAST_BIT = 0x0000010000000000ULL;

  constexpr bool is_multicast(uint64_t node_identifier) {
    return (node_identifier & MULTICAST_BIT) != 0;
  }

  constexpr uint64_t set_multicast(uint64_t node_identifier) {
    return (node_identifier & NODE_IDENTIFIER_MASK) | MULTICAST_BIT;
  }

  // 48 secure random bits with the multicast bit set
  uint64_t random_node_identifier();

  // First non-loopback interface with a non-zero 6-byte link address
  std::optional<uint64_t> hardware_address();

  // Supplies the node identifier for time-based creators
  class NodeIdentifierSource {
  public:
    virtual ~NodeIdentifierSource() = default;
    virtual uint64_t node_identifier() const = 0;
  };

  // Random multicast value drawn once at construction
  class RandomNodeIdentifierSource : public NodeIdentifierSource {
  public:
    RandomNodeIdentifierSource() : node_identifier_(random_node_identifier()) {}
    uint64_t node_identifier() const override { return node_identifier_; }

  private:
    const uint64_t node_identifier_;
  };

  // Caller-supplied value, masked to 48 bits
  class FixedNodeIdentifierSource : public NodeIdentifierSource {
  public:
    explicit FixedNodeIdentifierSource(uint64_t node_identifier, bool multicast = false)
        : node_identifier_(multicast ? set_multicast(node_identifier)
                                     : node_identifier & NODE_IDENTIFIER_MASK) {}

    uint64_t node_identifier() const override { return node_identifier_; }

  private:
    const uint64_t node_identifier_;
  };

  // Hardware address looked up once; random multicast value when none exists
  class HardwareAddressNodeIdentifierSource : public NodeIdentifierSource {
  public:
    HardwareAddressNodeIdentifierSource();

    uint64_t node_identifier() const override { return node_identifier_; }

    // False when the random fallback is in use
    bool is_hardware_address() const { return hardware_; }

  private:
    bool hardware_ = false;
    uint64_t node_identifier_ = 0;
  };

}  // namespace uuidcraft
