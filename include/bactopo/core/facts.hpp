/* Discovery facts: the validated records the engine hands to the builder. */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "bactopo/core/address.hpp"

namespace bactopo::core {

// The scanning node itself. Anchors the synthetic root entity.
struct ScannerFact {
  std::uint32_t instance {0};
  std::string name;
  IpEndpoint address {};
  Ipv4Subnet subnet {};
  std::uint16_t vendor_id {0};
  // Filled by the self probe after enumeration.
  std::optional<IpEndpoint> closest_distributor {};

  ScannerFact() = default;
  ScannerFact(std::uint32_t instance, std::string name, IpEndpoint address,
              Ipv4Subnet subnet, std::uint16_t vendor_id);
};

// One device that answered Who-Is with I-Am.
struct DeviceFact {
  std::uint32_t instance {0};
  BacnetAddress address {};
  std::uint16_t vendor_id {0};
  std::uint32_t max_apdu {0};
  std::uint8_t segmentation {3};  // 3 = no-segmentation

  DeviceFact() = default;
  DeviceFact(std::uint32_t instance, BacnetAddress address, std::uint16_t vendor_id,
             std::uint32_t max_apdu = 1476, std::uint8_t segmentation = 3);

  // Remote BACnet network the device was reached on, nullopt when local.
  [[nodiscard]] std::optional<std::uint16_t> network() const noexcept {
    if (address.is_local()) return std::nullopt;
    return address.net;
  }
};

// A router that answered Who-Is-Router-To-Network.
struct RouterFact {
  IpEndpoint address {};
  std::vector<std::uint16_t> networks;  // sorted, unique

  RouterFact() = default;
  RouterFact(IpEndpoint address, std::vector<std::uint16_t> networks);
};

// A peer that acknowledged Read-Broadcast-Distribution-Table.
struct DistributorFact {
  IpEndpoint address {};
  std::vector<IpEndpoint> bdt;

  DistributorFact() = default;
  DistributorFact(IpEndpoint address, std::vector<IpEndpoint> bdt);
};

// An IP subnet known from configuration.
struct SubnetFact {
  Ipv4Subnet subnet {};

  SubnetFact() = default;
  explicit SubnetFact(Ipv4Subnet subnet) : subnet(subnet) {}
};

using Fact = std::variant<ScannerFact, DeviceFact, RouterFact, DistributorFact, SubnetFact>;

} // namespace bactopo::core
