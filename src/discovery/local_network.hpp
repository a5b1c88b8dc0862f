#pragma once

#include <cstdint>
#include <string>

namespace camscout::discovery {

// Scan network derived from the host's own IPv4 interface.
struct LocalIpv4Network {
  std::string interface_name;
  std::string address;
  std::uint32_t prefix_length = 24;
  // CIDR text usable as a scan target, e.g. `192.168.1.0/24`.
  std::string cidr;
};

// Networks wider than /24 are clamped to the /24 holding `address`, which
// keeps an `auto` scan on a corporate /16 to 254 hosts.
LocalIpv4Network ComputeScanNetwork(std::uint32_t address, std::uint32_t netmask);

// First interface that is up, not loopback, and carries an IPv4 address.
bool DetectLocalIpv4Network(LocalIpv4Network& network, std::string& error);

} // namespace camscout::discovery
