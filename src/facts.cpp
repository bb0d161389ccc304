#include "bactopo/core/facts.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "bactopo/core/error.hpp"

namespace bactopo::core {

ScannerFact::ScannerFact(std::uint32_t instance_, std::string name_, IpEndpoint address_,
                         Ipv4Subnet subnet_, std::uint16_t vendor_id_)
    : instance(instance_), name(std::move(name_)), address(address_), subnet(subnet_),
      vendor_id(vendor_id_) {
  if (instance > kMaxDeviceInstance) {
    throw ValueError("scanner instance must be <= 4194302");
  }
  if (!subnet.contains(address)) {
    throw ValueError("scanner address " + address.to_string() + " is outside " + subnet.to_string());
  }
}

DeviceFact::DeviceFact(std::uint32_t instance_, BacnetAddress address_, std::uint16_t vendor_id_,
                       std::uint32_t max_apdu_, std::uint8_t segmentation_)
    : instance(instance_), address(std::move(address_)), vendor_id(vendor_id_),
      max_apdu(max_apdu_), segmentation(segmentation_) {
  if (instance > kMaxDeviceInstance) {
    throw ValueError("device instance " + std::to_string(instance) + " out of range");
  }
  if (address.mac.empty()) {
    throw ValueError("device " + std::to_string(instance) + " has an empty address");
  }
  if (address.net == 0xFFFF) {
    throw ValueError("device " + std::to_string(instance) + " reported the global broadcast network");
  }
  if (segmentation > 3) {
    throw ValueError("device " + std::to_string(instance) + " has invalid segmentation");
  }
}

RouterFact::RouterFact(IpEndpoint address_, std::vector<std::uint16_t> networks_)
    : address(address_), networks(std::move(networks_)) {
  if (networks.empty()) {
    throw ValueError("router " + address.to_string() + " reported no networks");
  }
  for (auto net : networks) {
    if (net == 0 || net == 0xFFFF) {
      throw ValueError("router " + address.to_string() + " reported invalid network " +
                       std::to_string(net));
    }
  }
  std::sort(networks.begin(), networks.end());
  networks.erase(std::unique(networks.begin(), networks.end()), networks.end());
}

DistributorFact::DistributorFact(IpEndpoint address_, std::vector<IpEndpoint> bdt_)
    : address(address_), bdt(std::move(bdt_)) {
  std::sort(bdt.begin(), bdt.end());
  bdt.erase(std::unique(bdt.begin(), bdt.end()), bdt.end());
}

} // namespace bactopo::core
