#include "bactopo/core/types.hpp"

#include <array>
#include <utility>

namespace bactopo::core {

namespace {
constexpr std::array<std::pair<EntityKind, std::string_view>, 6> kEntityNames {{
  {EntityKind::Device, "Device"},
  {EntityKind::Router, "Router"},
  {EntityKind::Network, "Network"},
  {EntityKind::Subnet, "Subnet"},
  {EntityKind::BroadcastDistributor, "BBMD"},
  {EntityKind::Root, "Scanner"},
}};

constexpr std::array<std::pair<EdgeKind, std::string_view>, 7> kEdgeNames {{
  {EdgeKind::DeviceOnNetwork, "device-on-network"},
  {EdgeKind::RouterToNetwork, "router-to-network"},
  {EdgeKind::NetworkViaSubnet, "network-via-subnet"},
  {EdgeKind::BdtEntry, "bdt-entry"},
  {EdgeKind::RootLink, "root-link"},
  {EdgeKind::DeviceOnSubnet, "device-on-subnet"},
  {EdgeKind::BbmdBroadcastDomain, "bbmd-broadcast-domain"},
}};
} // namespace

std::string_view to_string(EntityKind kind) noexcept {
  for (const auto& [k, name] : kEntityNames) {
    if (k == kind) return name;
  }
  return "Unknown";
}

std::string_view to_string(EdgeKind kind) noexcept {
  for (const auto& [k, name] : kEdgeNames) {
    if (k == kind) return name;
  }
  return "unknown";
}

std::string_view to_string(Provenance p) noexcept {
  switch (p) {
    case Provenance::Removed: return "removed";
    case Provenance::Added: return "added";
    case Provenance::Unchanged: return "unchanged";
  }
  return "unknown";
}

std::optional<EntityKind> entity_kind_from_string(std::string_view s) noexcept {
  for (const auto& [k, name] : kEntityNames) {
    if (name == s) return k;
  }
  return std::nullopt;
}

std::optional<EdgeKind> edge_kind_from_string(std::string_view s) noexcept {
  for (const auto& [k, name] : kEdgeNames) {
    if (name == s) return k;
  }
  return std::nullopt;
}

} // namespace bactopo::core
