/* IPv4 endpoints, IPv4 subnets and BACnet (network, MAC) addresses. */
#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bactopo/core/types.hpp"

namespace bactopo::core {

struct IpEndpoint {
  std::array<std::uint8_t, 4> octets {};
  std::uint16_t port { kDefaultBacnetPort };

  [[nodiscard]] std::uint32_t to_u32() const noexcept;
  [[nodiscard]] static IpEndpoint from_u32(std::uint32_t addr, std::uint16_t port = kDefaultBacnetPort) noexcept;

  // "a.b.c.d" when the port is 47808, "a.b.c.d:port" otherwise.
  [[nodiscard]] std::string to_string() const;
  // Dotted quad only, no port.
  [[nodiscard]] std::string host_string() const;

  friend auto operator<=>(const IpEndpoint&, const IpEndpoint&) = default;
};

// Parses "a.b.c.d" or "a.b.c.d:port". Throws ValueError.
[[nodiscard]] IpEndpoint parse_ip_endpoint(std::string_view text);

struct Ipv4Subnet {
  std::array<std::uint8_t, 4> network {};  // host bits always zero
  std::uint8_t prefix_len {0};

  [[nodiscard]] std::uint32_t mask() const noexcept;
  [[nodiscard]] bool contains(const IpEndpoint& ip) const noexcept;
  [[nodiscard]] IpEndpoint broadcast(std::uint16_t port = kDefaultBacnetPort) const noexcept;
  [[nodiscard]] std::string to_string() const;

  friend auto operator<=>(const Ipv4Subnet&, const Ipv4Subnet&) = default;
};

// Parses "a.b.c.d/n"; host bits are masked off rather than rejected.
[[nodiscard]] Ipv4Subnet parse_subnet(std::string_view text);
[[nodiscard]] Ipv4Subnet make_subnet(const IpEndpoint& ip, std::uint8_t prefix_len);
// Fallback grouping when no configured subnet contains the address.
[[nodiscard]] inline Ipv4Subnet default_subnet_for(const IpEndpoint& ip) { return make_subnet(ip, 24); }

// Agent address in the "a.b.c.d/n:port" form used by the configuration store.
struct AgentAddress {
  IpEndpoint endpoint {};
  Ipv4Subnet subnet {};
};
[[nodiscard]] AgentAddress parse_agent_address(std::string_view text);

// BACnet address: net == 0 is the local network, where a BACnet/IP MAC is the
// 6-byte (ip, port) pair. Remote addresses carry the router-reported MAC.
struct BacnetAddress {
  std::uint16_t net {0};
  std::vector<std::uint8_t> mac {};

  [[nodiscard]] static BacnetAddress from_ip(const IpEndpoint& ip);
  [[nodiscard]] bool is_local() const noexcept { return net == 0; }
  [[nodiscard]] std::optional<IpEndpoint> ip() const noexcept;
  // "192.168.1.20" / "192.168.1.20:47809" locally, "2001:0a" remotely.
  [[nodiscard]] std::string to_string() const;

  friend auto operator<=>(const BacnetAddress&, const BacnetAddress&) = default;
};

} // namespace bactopo::core
