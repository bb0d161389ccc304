/* Scan configuration: immutable value handed to the discovery engine. */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "bactopo/core/address.hpp"
#include "bactopo/core/types.hpp"

namespace bactopo::core {

// Keys and defaults follow the agent's JSON config store.
struct ScanConfig {
  std::uint32_t low_limit {0};
  std::uint32_t high_limit {kMaxInstance};
  std::uint32_t batch_broadcast_size {10000};
  // With a previous snapshot, a Who-Is window closes once it spans this many
  // devices that snapshot already knew.
  std::uint32_t full_step_size {100};
  std::chrono::milliseconds response_timeout {3000};
  // Consumed by whatever schedules periodic scans; the engine ignores it.
  std::int64_t scan_interval_secs {86400};

  std::string agent_address {"192.168.1.12/24:47808"};
  // Who-Is destination. Empty means the agent subnet's directed broadcast.
  std::string broadcast_address {};
  std::uint32_t device_instance {4194300};
  std::string device_name {"bactopo"};
  std::uint16_t vendor_id {999};

  std::vector<IpEndpoint> bbmds {};
  std::vector<Ipv4Subnet> subnets {};
  std::size_t probe_fanout {8};
  bool probe_all_devices_for_bdt {true};

  std::size_t graph_store_limit {30};
  std::string log_level {"info"};

  // Throws ConfigError describing the first invalid field.
  void validate() const;

  // Parsed views of the address strings. Throw ConfigError.
  [[nodiscard]] AgentAddress agent() const;
  [[nodiscard]] IpEndpoint broadcast() const;
};

// Missing keys keep their defaults and unknown keys are ignored. A key with
// the wrong JSON type, or a result that fails validate(), throws ConfigError.
[[nodiscard]] ScanConfig scan_config_from_json(const nlohmann::json& j);
[[nodiscard]] ScanConfig parse_scan_config(std::string_view text);
[[nodiscard]] ScanConfig load_scan_config(const std::string& path);

[[nodiscard]] nlohmann::json to_json(const ScanConfig& cfg);

} // namespace bactopo::core
