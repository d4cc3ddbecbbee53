#include <uuidcraft/crypto.h>
#include <uuidcraft/node_identifier.h>

#include <iostream>

#ifdef __linux__
#  include <ifaddrs.h>
#  include <linux/if_packet.h>
#  include <net/if.h>
#  include <sys/socket.h>
#endif

namespace uuidcraft {

  uint64_t random_node_identifier() {
    uint8_t bytes[6];
    crypto::random_bytes(bytes, sizeof(bytes));

    uint64_t node = 0;
    for (uint8_t b : bytes) {
      node = (node << 8) | b;
    }
    return set_multicast(node);
  }

  std::optional<uint64_t> hardware_address() {
#ifdef __linux__
    struct ifaddrs* ifap = nullptr;
    if (getifaddrs(&ifap) != 0) {
      return std::nullopt;
    }

    std::optional<uint64_t> found;
    for (struct ifaddrs* ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
      if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_PACKET) continue;

      // Skip loopback interfaces
      if (ifa->ifa_flags & IFF_LOOPBACK) continue;

      auto* sll = reinterpret_cast<struct sockaddr_ll*>(ifa->ifa_addr);
      if (sll->sll_halen != 6) continue;

      uint64_t node = 0;
      for (int i = 0; i < 6; i++) {
        node = (node << 8) | sll->sll_addr[i];
      }

      // Skip all-zero addresses (unconfigured)
      if (node == 0) continue;

      found = node;
      break;
    }

    freeifaddrs(ifap);
    return found;
#else
    return std::nullopt;
#endif
  }

  HardwareAddressNodeIdentifierSource::HardwareAddressNodeIdentifierSource() {
    if (auto address = hardware_address()) {
      hardware_ = true;
      node_identifier_ = *address;
      return;
    }

    std::cerr << "No hardware address found, using a random node identifier" << std::endl;
    node_identifier_ = random_node_identifier();
  }

}  // namespace uuidcraft
