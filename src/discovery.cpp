/*
  Discovery engine.

  Phases, each strictly after the previous one:
    1. enumeration: one Who-Is per planned batch, each followed by its full
       response window, so an I-Am is only ever attributed to the batch
       whose range contains it;
    2. router lookup: one global Who-Is-Router-To-Network, then a directed
       query for every remote network seen on a device but not yet claimed;
    3. BDT reads against configured BBMDs and (optionally) every IP device;
    4. self probe: BFS over a provisional graph from the scanner root to the
       nearest BBMD.
  Probes in phases 2 and 3 go out in groups of probe_fanout that share one
  response window; results are folded in group order.
*/
#include "bactopo/core/discovery.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "bactopo/core/bacnet_codec.hpp"
#include "bactopo/core/error.hpp"
#include "bactopo/core/graph_builder.hpp"
#include "bactopo/core/log.hpp"

namespace bactopo::core {

std::vector<InstanceRange> plan_batches(std::uint32_t low, std::uint32_t high, std::uint32_t batch_size) {
  return plan_batches(low, high, batch_size, {}, 1);
}

std::vector<InstanceRange> plan_batches(std::uint32_t low, std::uint32_t high, std::uint32_t batch_size,
                                        const std::set<std::uint32_t>& known, std::uint32_t full_step) {
  if (batch_size == 0) throw ValueError("batch_size must be positive");
  if (full_step == 0) throw ValueError("full_step must be positive");
  if (low > high) {
    throw ValueError("low_id " + std::to_string(low) + " is greater than high_id " + std::to_string(high));
  }
  if (high > kMaxInstance) throw ValueError("high_id exceeds " + std::to_string(kMaxInstance));
  std::vector<InstanceRange> out;
  out.reserve(static_cast<std::size_t>((std::uint64_t{high} - low) / batch_size + 1));
  for (std::uint64_t lo = low; lo <= high;) {
    std::uint64_t hi = std::min<std::uint64_t>(lo + batch_size - 1, high);
    std::uint32_t seen = 0;
    for (auto it = known.lower_bound(static_cast<std::uint32_t>(lo)); it != known.end() && *it <= hi; ++it) {
      if (++seen == full_step) {
        hi = *it;
        break;
      }
    }
    out.push_back(InstanceRange{static_cast<std::uint32_t>(lo), static_cast<std::uint32_t>(hi)});
    lo = hi + 1;
  }
  return out;
}

std::set<std::uint32_t> known_device_instances(const NetworkGraph& g) {
  std::set<std::uint32_t> out;
  for (const auto& e : g.entities()) {
    if (e.kind == EntityKind::Root) continue;
    auto it = e.attributes.find("device-instance");
    if (it == e.attributes.end()) continue;
    const auto* n = std::get_if<std::int64_t>(&it->second);
    if (n && *n >= 0 && *n <= kMaxInstance) out.insert(static_cast<std::uint32_t>(*n));
  }
  return out;
}

struct DiscoveryEngine::Probe {
  enum class Kind { ReadBdt, RouterLookup };
  Kind kind {Kind::ReadBdt};
  IpEndpoint dest {};
  std::optional<std::uint16_t> network {};  // RouterLookup only
};

struct DiscoveryEngine::Collected {
  std::map<std::uint32_t, DeviceFact> devices;
  std::map<IpEndpoint, std::set<std::uint16_t>> routers;
  std::map<IpEndpoint, std::vector<IpEndpoint>> distributors;
};

namespace {

// Receive errors end the current window; they never escape the engine.
std::optional<Datagram> next_datagram(Transport& t, Transport::Clock::time_point deadline) {
  try {
    return t.receive(deadline);
  } catch (const TransportError& e) {
    logger()->error("receive failed: {}", e.what());
    return std::nullopt;
  }
}

std::optional<bacnet::Message> decode(const Datagram& d) {
  try {
    return bacnet::decode_frame(d.payload, d.source);
  } catch (const DecodeError& e) {
    logger()->debug("malformed frame from {}: {}", d.source.to_string(), e.what());
    return std::nullopt;
  }
}

} // namespace

DiscoveryEngine::DiscoveryEngine(ScanConfig config, TransportPtr transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  config_.validate();
  if (!transport_) throw ValueError("DiscoveryEngine requires a transport");
  agent_ = config_.agent();
  broadcast_ = config_.broadcast();
}

void DiscoveryEngine::set_previous_snapshot(const NetworkGraph& previous) {
  known_instances_ = known_device_instances(previous);
  logger()->debug("previous snapshot {} knows {} device(s)", previous.name(), known_instances_.size());
}

DiscoveryResult DiscoveryEngine::discover() {
  return discover(config_.low_limit, config_.high_limit, config_.batch_broadcast_size,
                  config_.response_timeout);
}

DiscoveryResult DiscoveryEngine::discover(std::uint32_t low, std::uint32_t high,
                                          std::uint32_t batch_size,
                                          std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) throw ValueError("response timeout must be positive");
  const auto ranges = plan_batches(low, high, batch_size, known_instances_, config_.full_step_size);
  logger()->info("discovery over [{}, {}] in {} batch(es) of <= {}", low, high, ranges.size(), batch_size);

  DiscoveryResult result;
  Collected c;
  for (const auto& r : ranges) result.batches.push_back(run_batch(r, timeout, c, result));

  // Router lookup: global query first, then anything still unexplained.
  run_probes({Probe{Probe::Kind::RouterLookup, broadcast_, std::nullopt}}, timeout, c, result);
  std::set<std::uint16_t> covered;
  for (const auto& [addr, nets] : c.routers) covered.insert(nets.begin(), nets.end());
  std::vector<Probe> probes;
  std::set<std::uint16_t> unexplained;
  for (const auto& [inst, d] : c.devices) {
    if (auto net = d.network(); net && !covered.contains(*net)) unexplained.insert(*net);
  }
  for (auto net : unexplained) probes.push_back(Probe{Probe::Kind::RouterLookup, broadcast_, net});
  run_probes(probes, timeout, c, result);

  std::set<IpEndpoint> bdt_targets(config_.bbmds.begin(), config_.bbmds.end());
  if (config_.probe_all_devices_for_bdt) {
    for (const auto& [inst, d] : c.devices) {
      if (auto ip = d.address.ip()) bdt_targets.insert(*ip);
    }
  }
  probes.clear();
  for (const auto& t : bdt_targets) probes.push_back(Probe{Probe::Kind::ReadBdt, t, std::nullopt});
  run_probes(probes, timeout, c, result);

  result.facts.emplace_back(ScannerFact(config_.device_instance, config_.device_name,
                                        agent_.endpoint, agent_.subnet, config_.vendor_id));
  for (const auto& s : config_.subnets) result.facts.emplace_back(SubnetFact(s));
  for (auto& [inst, d] : c.devices) result.facts.emplace_back(std::move(d));
  for (const auto& [addr, nets] : c.routers) {
    result.facts.emplace_back(RouterFact(addr, std::vector<std::uint16_t>(nets.begin(), nets.end())));
  }
  for (auto& [addr, bdt] : c.distributors) result.facts.emplace_back(DistributorFact(addr, std::move(bdt)));

  auto closest = locate_closest_distributor(result.facts);
  std::get<ScannerFact>(result.facts.front()).closest_distributor = closest;

  logger()->info("discovery finished: {} device(s), {} router(s), {} BBMD(s), {} probe failure(s)",
                 c.devices.size(), c.routers.size(), c.distributors.size(), result.probe_failures);
  return result;
}

BatchReport DiscoveryEngine::run_batch(const InstanceRange& range, std::chrono::milliseconds timeout,
                                       Collected& out, DiscoveryResult& result) {
  BatchReport report{range, 0, true};
  logger()->debug("who-is [{}, {}] -> {}", range.low, range.high, broadcast_.to_string());
  try {
    transport_->send(broadcast_, bacnet::encode_who_is(range.low, range.high));
  } catch (const TransportError& e) {
    logger()->error("who-is [{}, {}] not sent: {}", range.low, range.high, e.what());
    report.sent = false;
    result.complete = false;
    return report;
  }

  std::set<std::uint32_t> seen;
  const auto deadline = Clock::now() + timeout;
  while (auto dgram = next_datagram(*transport_, deadline)) {
    auto msg = decode(*dgram);
    if (!msg) continue;
    const auto* iam = std::get_if<bacnet::IAm>(&*msg);
    if (!iam) continue;
    if (!range.contains(iam->device_instance)) {
      logger()->debug("ignoring I-Am from {} outside [{}, {}]", iam->device_instance, range.low, range.high);
      continue;
    }
    try {
      out.devices.insert_or_assign(iam->device_instance,
                                   DeviceFact(iam->device_instance, iam->source, iam->vendor_id,
                                              iam->max_apdu, iam->segmentation));
      seen.insert(iam->device_instance);
    } catch (const ValueError& e) {
      logger()->debug("rejected I-Am: {}", e.what());
    }
  }
  report.responses = seen.size();
  logger()->debug("who-is [{}, {}]: {} device(s)", range.low, range.high, report.responses);
  return report;
}

void DiscoveryEngine::run_probes(const std::vector<Probe>& probes, std::chrono::milliseconds timeout,
                                 Collected& out, DiscoveryResult& result) {
  const std::size_t fanout = config_.probe_fanout;
  for (std::size_t i = 0; i < probes.size(); i += fanout) {
    auto last = std::min(probes.size(), i + fanout);
    std::vector<Probe> group(probes.begin() + static_cast<std::ptrdiff_t>(i),
                             probes.begin() + static_cast<std::ptrdiff_t>(last));
    run_group(group, timeout, out, result);
  }
}

void DiscoveryEngine::run_group(const std::vector<Probe>& group, std::chrono::milliseconds timeout,
                                Collected& out, DiscoveryResult& result) {
  std::set<IpEndpoint> pending_bdt;
  bool router_lookup = false;
  for (const auto& p : group) {
    try {
      if (p.kind == Probe::Kind::ReadBdt) {
        transport_->send(p.dest, bacnet::encode_read_bdt());
        pending_bdt.insert(p.dest);
      } else {
        transport_->send(p.dest, bacnet::encode_who_is_router_to_network(p.network));
        router_lookup = true;
      }
    } catch (const TransportError& e) {
      ++result.probe_failures;
      logger()->warn("probe to {} not sent: {}", p.dest.to_string(), e.what());
    }
  }
  if (pending_bdt.empty() && !router_lookup) return;

  // Broadcast lookups can be answered by any number of routers, so a group
  // containing one always waits out the whole window.
  const auto deadline = Clock::now() + timeout;
  while (router_lookup || !pending_bdt.empty()) {
    auto dgram = next_datagram(*transport_, deadline);
    if (!dgram) break;
    auto msg = decode(*dgram);
    if (!msg) {
      ++result.probe_failures;
      continue;
    }
    std::visit([&](const auto& m) {
      using T = std::decay_t<decltype(m)>;
      if constexpr (std::is_same_v<T, bacnet::ReadBdtAck>) {
        if (pending_bdt.erase(m.source) == 0) {
          logger()->debug("unsolicited Read-BDT-Ack from {}", m.source.to_string());
          return;
        }
        std::vector<IpEndpoint> bdt;
        bdt.reserve(m.entries.size());
        for (const auto& e : m.entries) bdt.push_back(e.address);
        out.distributors.insert_or_assign(m.source, std::move(bdt));
      } else if constexpr (std::is_same_v<T, bacnet::BvlcResult>) {
        if (pending_bdt.erase(m.source) != 0 && m.code == bacnet::kResultReadBdtNak) {
          logger()->debug("{} is not a BBMD", m.source.to_string());
        }
      } else if constexpr (std::is_same_v<T, bacnet::IAmRouterToNetwork>) {
        auto& nets = out.routers[m.source];
        for (auto n : m.networks) {
          if (n != 0 && n != bacnet::kGlobalNetwork) nets.insert(n);
        }
        if (nets.empty()) out.routers.erase(m.source);
      }
    }, *msg);
  }
  for (const auto& p : pending_bdt) {
    ++result.probe_timeouts;
    logger()->debug("no Read-BDT answer from {}", p.to_string());
  }
}

std::optional<IpEndpoint> DiscoveryEngine::locate_closest_distributor(const std::vector<Fact>& facts) const {
  auto provisional = build_graph(facts, BuildOptions{"provisional", ""});
  auto id = provisional.nearest(ids::root(), EntityKind::BroadcastDistributor);
  if (!id) return std::nullopt;
  const auto* entity = provisional.find(*id);
  auto it = entity->attributes.find("address");
  if (it == entity->attributes.end()) return std::nullopt;
  const auto* text = std::get_if<std::string>(&it->second);
  if (!text) return std::nullopt;
  try {
    return parse_ip_endpoint(*text);
  } catch (const ValueError& e) {
    logger()->warn("closest BBMD {} has an unusable address: {}", *id, e.what());
    return std::nullopt;
  }
}

} // namespace bactopo::core
