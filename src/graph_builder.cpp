/*
  Graph builder: turns discovery facts into a NetworkGraph.

  Facts are first gathered per kind (devices by instance, routers and
  distributors by address) so the result does not depend on the order the
  engine reported them in. Entities are then materialized into an id-keyed
  map and edges are emitted declaratively per kind. A final pass drops any
  edge whose endpoint never materialized before the graph is compacted.
*/
#include "bactopo/core/graph_builder.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "bactopo/core/log.hpp"

namespace bactopo::core {

namespace ids {
std::string root() { return std::string(kScheme) + "scanner"; }
std::string device(std::uint32_t instance) { return std::string(kScheme) + std::to_string(instance); }
std::string router(const IpEndpoint& address) { return std::string(kScheme) + "router/" + address.to_string(); }
std::string network(std::uint16_t number) { return std::string(kScheme) + "network/" + std::to_string(number); }
std::string subnet(const Ipv4Subnet& s) { return std::string(kScheme) + "subnet/" + s.to_string(); }
std::string distributor(const IpEndpoint& address) { return std::string(kScheme) + "bbmd/" + address.to_string(); }
} // namespace ids

namespace {

struct Gathered {
  std::optional<ScannerFact> scanner;
  std::map<std::uint32_t, DeviceFact> devices;
  std::map<IpEndpoint, std::set<std::uint16_t>> routers;
  std::map<IpEndpoint, std::set<IpEndpoint>> distributors;
  std::set<Ipv4Subnet> configured_subnets;
};

Gathered gather(std::span<const Fact> facts) {
  Gathered g;
  for (const auto& fact : facts) {
    std::visit([&g](const auto& f) {
      using T = std::decay_t<decltype(f)>;
      if constexpr (std::is_same_v<T, ScannerFact>) {
        g.scanner = f;
      } else if constexpr (std::is_same_v<T, DeviceFact>) {
        g.devices.insert_or_assign(f.instance, f);  // last seen wins
      } else if constexpr (std::is_same_v<T, RouterFact>) {
        g.routers[f.address].insert(f.networks.begin(), f.networks.end());
      } else if constexpr (std::is_same_v<T, DistributorFact>) {
        g.distributors[f.address].insert(f.bdt.begin(), f.bdt.end());
      } else {
        g.configured_subnets.insert(f.subnet);
      }
    }, fact);
  }
  return g;
}

class Assembler {
public:
  explicit Assembler(const Gathered& g) : g_(g) {
    known_subnets_.assign(g.configured_subnets.begin(), g.configured_subnets.end());
    if (g.scanner) known_subnets_.push_back(g.scanner->subnet);
    // Most specific first; ties resolve by network address.
    std::sort(known_subnets_.begin(), known_subnets_.end(), [](const Ipv4Subnet& a, const Ipv4Subnet& b) {
      if (a.prefix_len != b.prefix_len) return a.prefix_len > b.prefix_len;
      return a.network < b.network;
    });
    known_subnets_.erase(std::unique(known_subnets_.begin(), known_subnets_.end()), known_subnets_.end());
  }

  NetworkGraph run(const BuildOptions& opts) {
    for (const auto& s : known_subnets_) add_subnet(s);
    add_root();
    add_devices();
    add_routers();
    add_distributors();
    link_closest_distributor();
    return finish(opts);
  }

private:
  std::optional<Ipv4Subnet> known_subnet_for(const IpEndpoint& ip) const {
    for (const auto& s : known_subnets_) {
      if (s.contains(ip)) return s;
    }
    return std::nullopt;
  }

  std::string subnet_for(const IpEndpoint& ip) {
    return add_subnet(known_subnet_for(ip).value_or(default_subnet_for(ip)));
  }

  std::string add_subnet(const Ipv4Subnet& s) {
    auto id = ids::subnet(s);
    if (!entities_.contains(id)) {
      Entity e{id, EntityKind::Subnet, s.to_string(), {}};
      e.attributes["prefix-length"] = static_cast<std::int64_t>(s.prefix_len);
      entities_.emplace(id, std::move(e));
    }
    return id;
  }

  std::string add_network(std::uint16_t net) {
    auto id = ids::network(net);
    if (!entities_.contains(id)) {
      Entity e{id, EntityKind::Network, "Network " + std::to_string(net), {}};
      e.attributes["network-number"] = static_cast<std::int64_t>(net);
      entities_.emplace(id, std::move(e));
    }
    return id;
  }

  void add_edge(EdgeKind kind, std::string from, std::string to) {
    edges_.push_back(Edge{kind, std::move(from), std::move(to)});
  }

  void add_root() {
    if (!g_.scanner) return;
    const auto& s = *g_.scanner;
    Entity e{ids::root(), EntityKind::Root, s.name, {}};
    e.attributes["device-instance"] = static_cast<std::int64_t>(s.instance);
    e.attributes["address"] = s.address.to_string();
    e.attributes["vendor-id"] = static_cast<std::int64_t>(s.vendor_id);
    entities_.emplace(e.id, std::move(e));
    add_edge(EdgeKind::RootLink, ids::root(), add_subnet(s.subnet));
  }

  void add_devices() {
    for (const auto& [instance, d] : g_.devices) {
      auto id = ids::device(instance);
      Entity e{id, EntityKind::Device, "Device " + std::to_string(instance), {}};
      e.attributes["device-instance"] = static_cast<std::int64_t>(instance);
      e.attributes["address"] = d.address.to_string();
      e.attributes["vendor-id"] = static_cast<std::int64_t>(d.vendor_id);
      e.attributes["max-apdu"] = static_cast<std::int64_t>(d.max_apdu);
      e.attributes["segmentation"] = static_cast<std::int64_t>(d.segmentation);
      if (auto net = d.network()) {
        e.attributes["network-number"] = static_cast<std::int64_t>(*net);
        add_edge(EdgeKind::DeviceOnNetwork, id, add_network(*net));
      } else if (auto ip = d.address.ip()) {
        device_by_ip_.emplace(*ip, id);
        add_edge(EdgeKind::DeviceOnSubnet, id, subnet_for(*ip));
      }
      entities_.insert_or_assign(id, std::move(e));
    }
  }

  void add_routers() {
    for (const auto& [addr, networks] : g_.routers) {
      auto id = ids::router(addr);
      Entity e{id, EntityKind::Router, "Router " + addr.to_string(), {}};
      e.attributes["address"] = addr.to_string();
      std::string list;
      for (auto net : networks) {
        if (!list.empty()) list += ",";
        list += std::to_string(net);
      }
      e.attributes["networks"] = list;
      entities_.insert_or_assign(id, std::move(e));

      auto subnet_id = subnet_for(addr);
      add_edge(EdgeKind::DeviceOnSubnet, id, subnet_id);
      for (auto net : networks) {
        auto net_id = add_network(net);
        add_edge(EdgeKind::RouterToNetwork, id, net_id);
        add_edge(EdgeKind::NetworkViaSubnet, net_id, subnet_id);
      }
      if (g_.scanner && !known_subnet_for(addr)) {
        add_edge(EdgeKind::RootLink, ids::root(), id);
      }
    }
  }

  void add_distributors() {
    // Resolve ids first so BDT entries can point at distributors seen later.
    for (const auto& [addr, bdt] : g_.distributors) {
      auto dev = device_by_ip_.find(addr);
      if (dev != device_by_ip_.end()) {
        auto& e = entities_.at(dev->second);
        e.kind = EntityKind::BroadcastDistributor;
        distributor_by_ip_.emplace(addr, dev->second);
      } else {
        auto id = ids::distributor(addr);
        Entity e{id, EntityKind::BroadcastDistributor, "BBMD " + addr.to_string(), {}};
        e.attributes["address"] = addr.to_string();
        entities_.insert_or_assign(id, std::move(e));
        distributor_by_ip_.emplace(addr, id);
      }
    }
    for (const auto& [addr, bdt] : g_.distributors) {
      const auto& id = distributor_by_ip_.at(addr);
      auto& e = entities_.at(id);
      e.attributes["bdt-size"] = static_cast<std::int64_t>(bdt.size());
      add_edge(EdgeKind::BbmdBroadcastDomain, id, subnet_for(addr));
      for (const auto& peer : bdt) {
        if (peer == addr) {
          e.attributes["bdt-enabled"] = true;
          continue;
        }
        auto it = distributor_by_ip_.find(peer);
        if (it == distributor_by_ip_.end()) {
          // Endpoint never answered as a distributor; the finish pass reports it.
          add_edge(EdgeKind::BdtEntry, id, ids::distributor(peer));
          continue;
        }
        add_edge(EdgeKind::BdtEntry, id, it->second);
      }
    }
  }

  void link_closest_distributor() {
    if (!g_.scanner || !g_.scanner->closest_distributor) return;
    const auto& addr = *g_.scanner->closest_distributor;
    auto it = distributor_by_ip_.find(addr);
    std::string target = (it != distributor_by_ip_.end()) ? it->second : ids::distributor(addr);
    if (it != distributor_by_ip_.end()) {
      entities_.at(ids::root()).attributes["closest-bbmd"] = target;
    }
    add_edge(EdgeKind::RootLink, ids::root(), std::move(target));
  }

  NetworkGraph finish(const BuildOptions& opts) {
    std::vector<Edge> kept;
    kept.reserve(edges_.size());
    for (auto& e : edges_) {
      if (!entities_.contains(e.from) || !entities_.contains(e.to)) {
        logger()->warn("dropping {} edge {} -> {}: endpoint not discovered",
                       to_string(e.kind), e.from, e.to);
        continue;
      }
      kept.push_back(std::move(e));
    }
    std::vector<Entity> entities;
    entities.reserve(entities_.size());
    for (auto& [id, e] : entities_) entities.push_back(std::move(e));
    return NetworkGraph::from_parts(opts.name, opts.timestamp, std::move(entities), std::move(kept));
  }

  const Gathered& g_;
  std::vector<Ipv4Subnet> known_subnets_;
  std::map<std::string, Entity> entities_;
  std::vector<Edge> edges_;
  std::map<IpEndpoint, std::string> device_by_ip_;
  std::map<IpEndpoint, std::string> distributor_by_ip_;
};

} // namespace

NetworkGraph build_graph(std::span<const Fact> facts, const BuildOptions& opts) {
  auto gathered = gather(facts);
  return Assembler(gathered).run(opts);
}

} // namespace bactopo::core
