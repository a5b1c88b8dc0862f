#include "discovery/local_network.hpp"

#include "discovery/target_spec.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace camscout::discovery {

namespace {

constexpr std::uint32_t kMinScanPrefix = 24U;

std::uint32_t CountPrefixBits(std::uint32_t netmask) {
  std::uint32_t bits = 0;
  while ((netmask & 0x80000000U) != 0U) {
    ++bits;
    netmask <<= 1U;
  }
  return bits;
}

} // namespace

LocalIpv4Network ComputeScanNetwork(const std::uint32_t address, const std::uint32_t netmask) {
  std::uint32_t prefix = CountPrefixBits(netmask);
  if (prefix < kMinScanPrefix) {
    prefix = kMinScanPrefix;
  }
  const std::uint32_t mask = prefix == 0U ? 0U : (0xFFFFFFFFU << (32U - prefix));

  LocalIpv4Network network;
  network.address = FormatIpv4(address);
  network.prefix_length = prefix;
  network.cidr = FormatIpv4(address & mask) + "/" + std::to_string(prefix);
  return network;
}

bool DetectLocalIpv4Network(LocalIpv4Network& network, std::string& error) {
  ifaddrs* interfaces = nullptr;
  if (getifaddrs(&interfaces) != 0) {
    error = std::string("getifaddrs failed: ") + std::strerror(errno);
    return false;
  }

  bool found = false;
  for (const ifaddrs* entry = interfaces; entry != nullptr; entry = entry->ifa_next) {
    if (entry->ifa_addr == nullptr || entry->ifa_netmask == nullptr ||
        entry->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    const unsigned int flags = entry->ifa_flags;
    if ((flags & IFF_UP) == 0U || (flags & IFF_LOOPBACK) != 0U) {
      continue;
    }

    const auto* address = reinterpret_cast<const sockaddr_in*>(entry->ifa_addr);
    const auto* netmask = reinterpret_cast<const sockaddr_in*>(entry->ifa_netmask);
    network = ComputeScanNetwork(ntohl(address->sin_addr.s_addr), ntohl(netmask->sin_addr.s_addr));
    network.interface_name = entry->ifa_name == nullptr ? "" : entry->ifa_name;
    found = true;
    break;
  }
  freeifaddrs(interfaces);

  if (!found) {
    error = "no up, non-loopback IPv4 interface found to derive the scan network";
    return false;
  }
  return true;
}

} // namespace camscout::discovery
