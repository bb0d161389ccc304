/* Core vocabulary types: entity/edge kinds, attributes, provenance.
 *
 * For Python developers:
 * - AttrValue: std::variant<bool, int64, str> (like a tagged Union[bool, int, str])
 * - Attributes: std::map keyed by name; iteration is sorted, so two maps with
 *   the same pairs compare equal regardless of insertion order (like dict ==)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace bactopo::core {

// BACnet device instances are 22-bit. 4194303 is the wildcard instance and is
// accepted as a scan bound but never as a device identity.
inline constexpr std::uint32_t kMaxInstance = 4194303;
inline constexpr std::uint32_t kMaxDeviceInstance = 4194302;
inline constexpr std::uint16_t kDefaultBacnetPort = 47808;  // 0xBAC0

enum class EntityKind {
  Device = 1,
  Router = 2,
  Network = 3,
  Subnet = 4,
  BroadcastDistributor = 5,  // BBMD
  Root = 6                   // the scanning node itself
};

enum class EdgeKind {
  DeviceOnNetwork = 1,      // remote device -> BACnet network number
  RouterToNetwork = 2,      // router -> each network it reports
  NetworkViaSubnet = 3,     // network -> IP subnet of the router serving it
  BdtEntry = 4,             // BBMD -> BBMD listed in its BDT
  RootLink = 5,             // scanner -> anchor entity
  DeviceOnSubnet = 6,       // IP device/router -> IP subnet
  BbmdBroadcastDomain = 7   // BBMD -> IP subnet it relays for
};

// Diff classification of a DiffGraph element.
enum class Provenance {
  Removed = 1,    // only in graph A
  Added = 2,      // only in graph B
  Unchanged = 3   // in both
};

using AttrValue = std::variant<bool, std::int64_t, std::string>;
using Attributes = std::map<std::string, AttrValue, std::less<>>;

struct Entity {
  std::string id;
  EntityKind kind { EntityKind::Device };
  std::string label;
  Attributes attributes;

  friend bool operator==(const Entity& a, const Entity& b) = default;
};

// Edges have no identity beyond (kind, from, to).
struct Edge {
  EdgeKind kind { EdgeKind::DeviceOnNetwork };
  std::string from;
  std::string to;

  friend bool operator==(const Edge& a, const Edge& b) noexcept {
    return a.kind == b.kind && a.from == b.from && a.to == b.to;
  }
  friend bool operator<(const Edge& a, const Edge& b) noexcept {
    if (a.kind != b.kind) return a.kind < b.kind;
    if (a.from != b.from) return a.from < b.from;
    return a.to < b.to;
  }
};

// Names used in ids, logs and the Turtle vocabulary ("Device", "bdt-entry", ...).
[[nodiscard]] std::string_view to_string(EntityKind kind) noexcept;
[[nodiscard]] std::string_view to_string(EdgeKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Provenance p) noexcept;

[[nodiscard]] std::optional<EntityKind> entity_kind_from_string(std::string_view s) noexcept;
[[nodiscard]] std::optional<EdgeKind> edge_kind_from_string(std::string_view s) noexcept;

} // namespace bactopo::core
