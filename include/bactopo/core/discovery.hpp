/*
  Discovery engine: batched Who-Is enumeration followed by topology probes.

  For Python developers:
  - DiscoveryEngine owns its ScanConfig by value; there is no module-level
    scan state, so two engines with different configs can coexist.
  - TransportPtr is shared so tests can keep a handle on the fake transport.
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <vector>

#include "bactopo/core/facts.hpp"
#include "bactopo/core/network_graph.hpp"
#include "bactopo/core/scan_config.hpp"
#include "bactopo/core/transport.hpp"

namespace bactopo::core {

// Inclusive instance-id range probed by one Who-Is.
struct InstanceRange {
  std::uint32_t low {0};
  std::uint32_t high {0};

  [[nodiscard]] std::uint64_t size() const noexcept { return std::uint64_t{high} - low + 1; }
  [[nodiscard]] bool contains(std::uint32_t instance) const noexcept {
    return instance >= low && instance <= high;
  }
  friend bool operator==(const InstanceRange&, const InstanceRange&) = default;
};

// Contiguous ranges of at most batch_size ids that exactly cover [low, high].
// Throws ValueError for batch_size == 0, low > high or high > 4194303.
[[nodiscard]] std::vector<InstanceRange> plan_batches(std::uint32_t low, std::uint32_t high,
                                                      std::uint32_t batch_size);

// As above, but a batch also ends at the full_step-th id of `known` it would
// contain, so ranges that were dense in the last scan get narrower windows.
// Throws ValueError for full_step == 0.
[[nodiscard]] std::vector<InstanceRange> plan_batches(std::uint32_t low, std::uint32_t high,
                                                      std::uint32_t batch_size,
                                                      const std::set<std::uint32_t>& known,
                                                      std::uint32_t full_step);

// Field-device instances recorded in a snapshot ("device-instance"
// attributes). The scanner root is not a field device.
[[nodiscard]] std::set<std::uint32_t> known_device_instances(const NetworkGraph& g);

struct BatchReport {
  InstanceRange range {};
  std::size_t responses {0};  // distinct devices that answered in the window
  bool sent {true};           // false when the Who-Is could not be sent
};

struct DiscoveryResult {
  std::vector<Fact> facts {};
  std::vector<BatchReport> batches {};
  std::size_t probe_failures {0};  // send failures and malformed replies
  std::size_t probe_timeouts {0};  // unicast probes that got no answer
  // Every batch was sent. Silence from a batch does not clear this.
  bool complete {true};
};

class DiscoveryEngine {
public:
  using Clock = Transport::Clock;

  // Throws ConfigError if the config does not validate.
  DiscoveryEngine(ScanConfig config, TransportPtr transport);

  // Full pass with the configured bounds, batch size and window.
  [[nodiscard]] DiscoveryResult discover();
  [[nodiscard]] DiscoveryResult discover(std::uint32_t low, std::uint32_t high,
                                         std::uint32_t batch_size,
                                         std::chrono::milliseconds timeout);

  // Batches of later passes are planned around the devices `previous` holds.
  void set_previous_snapshot(const NetworkGraph& previous);

  [[nodiscard]] const ScanConfig& config() const noexcept { return config_; }

private:
  struct Probe;
  struct Collected;

  BatchReport run_batch(const InstanceRange& range, std::chrono::milliseconds timeout,
                        Collected& out, DiscoveryResult& result);
  void run_probes(const std::vector<Probe>& probes, std::chrono::milliseconds timeout,
                  Collected& out, DiscoveryResult& result);
  void run_group(const std::vector<Probe>& group, std::chrono::milliseconds timeout,
                 Collected& out, DiscoveryResult& result);
  [[nodiscard]] std::optional<IpEndpoint> locate_closest_distributor(const std::vector<Fact>& facts) const;

  ScanConfig config_;
  AgentAddress agent_;
  IpEndpoint broadcast_;
  TransportPtr transport_;
  std::set<std::uint32_t> known_instances_;
};

} // namespace bactopo::core
