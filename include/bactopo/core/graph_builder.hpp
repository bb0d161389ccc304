/* Graph builder: discovery facts -> NetworkGraph with stable ids. */
#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "bactopo/core/address.hpp"
#include "bactopo/core/facts.hpp"
#include "bactopo/core/network_graph.hpp"

namespace bactopo::core {

// Id scheme. Every id is derived from the entity kind and its discovered
// address or number only, so the same physical component maps to the same id
// in every scan that observes it.
namespace ids {
inline constexpr const char* kScheme = "bacnet://";
[[nodiscard]] std::string root();
[[nodiscard]] std::string device(std::uint32_t instance);
[[nodiscard]] std::string router(const IpEndpoint& address);
[[nodiscard]] std::string network(std::uint16_t number);
[[nodiscard]] std::string subnet(const Ipv4Subnet& subnet);
// BBMD that does not also answer Who-Is; otherwise it keeps its device id.
[[nodiscard]] std::string distributor(const IpEndpoint& address);
} // namespace ids

struct BuildOptions {
  std::string name {};
  std::string timestamp {};  // ISO-8601, supplied by the caller
};

// Builds the topology graph. Rules per fact kind:
//   device (remote)   device-on-network -> network
//   device (IP)       device-on-subnet -> most specific known subnet (else /24)
//   router            router-to-network -> each network, device-on-subnet,
//                     network-via-subnet from each routed network
//   distributor       upgrades the device at its address to BBMD,
//                     bbmd-broadcast-domain -> subnet, bdt-entry -> each known
//                     BBMD in its table; a self entry sets bdt-enabled
//   scanner           root entity, root-link -> own subnet, routers outside
//                     every known subnet, and the closest BBMD
// Edges whose endpoints do not resolve are dropped with a warning.
[[nodiscard]] NetworkGraph build_graph(std::span<const Fact> facts, const BuildOptions& opts = {});

} // namespace bactopo::core
