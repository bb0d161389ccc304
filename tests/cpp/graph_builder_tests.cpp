#include <gtest/gtest.h>
#include <algorithm>
#include "bactopo/core/graph_builder.hpp"
#include "test_utils.hpp"

using namespace bactopo::core;
using namespace bactopo::core::test;

namespace {

bool has_edge(const NetworkGraph& g, EdgeKind kind, const std::string& from, const std::string& to) {
  return g.contains(Edge{kind, from, to});
}

const AttrValue* attr(const NetworkGraph& g, const std::string& id, const std::string& key) {
  const auto* e = g.find(id);
  if (!e) return nullptr;
  auto it = e->attributes.find(key);
  return it == e->attributes.end() ? nullptr : &it->second;
}

} // namespace

TEST(GraphBuilder, SiteEntitiesAndEdges) {
  auto g = build_graph(make_site_facts());
  const auto subnet = ids::subnet(parse_subnet("192.168.1.0/24"));
  const auto router = ids::router(ip("192.168.1.1"));
  const auto net = ids::network(2001);

  EXPECT_EQ(g.num_entities(), 7);
  EXPECT_EQ(g.find(ids::root())->kind, EntityKind::Root);
  EXPECT_EQ(g.find(router)->kind, EntityKind::Router);
  EXPECT_EQ(g.find(net)->kind, EntityKind::Network);

  EXPECT_TRUE(has_edge(g, EdgeKind::RootLink, ids::root(), subnet));
  EXPECT_TRUE(has_edge(g, EdgeKind::DeviceOnSubnet, ids::device(100), subnet));
  EXPECT_TRUE(has_edge(g, EdgeKind::DeviceOnSubnet, ids::device(101), subnet));
  EXPECT_TRUE(has_edge(g, EdgeKind::DeviceOnNetwork, ids::device(2001), net));
  EXPECT_TRUE(has_edge(g, EdgeKind::RouterToNetwork, router, net));
  EXPECT_TRUE(has_edge(g, EdgeKind::NetworkViaSubnet, net, subnet));
  EXPECT_TRUE(has_edge(g, EdgeKind::DeviceOnSubnet, router, subnet));
  // Router sits inside the scanner's subnet: no direct root link.
  EXPECT_FALSE(has_edge(g, EdgeKind::RootLink, ids::root(), router));
}

TEST(GraphBuilder, DeviceAttributes) {
  auto g = build_graph(make_site_facts());
  const auto* addr = attr(g, ids::device(100), "address");
  ASSERT_NE(addr, nullptr);
  EXPECT_EQ(std::get<std::string>(*addr), "192.168.1.20");
  EXPECT_EQ(std::get<std::int64_t>(*attr(g, ids::device(100), "vendor-id")), 5);
  EXPECT_EQ(std::get<std::int64_t>(*attr(g, ids::device(2001), "network-number")), 2001);
  EXPECT_EQ(std::get<std::string>(*attr(g, ids::device(2001), "address")), "2001:0a");
  EXPECT_EQ(std::get<std::string>(*attr(g, ids::router(ip("192.168.1.1")), "networks")), "2001");
  EXPECT_EQ(g.find(ids::device(100))->label, "Device 100");
}

TEST(GraphBuilder, Idempotent) {
  auto facts = make_site_facts();
  auto a = build_graph(facts);
  auto b = build_graph(facts);
  EXPECT_TRUE(a == b);
}

TEST(GraphBuilder, IndependentOfFactOrder) {
  auto reference = build_graph(make_site_facts());
  for (unsigned seed = 1; seed <= 5; ++seed) {
    auto g = build_graph(shuffled(make_site_facts(), seed));
    EXPECT_TRUE(g == reference) << "seed " << seed;
  }
}

TEST(GraphBuilder, LastDeviceFactWins) {
  std::vector<Fact> facts;
  facts.emplace_back(DeviceFact(7, BacnetAddress::from_ip(ip("10.0.0.7")), 1));
  facts.emplace_back(DeviceFact(7, BacnetAddress::from_ip(ip("10.0.0.7")), 2));
  auto g = build_graph(facts);
  EXPECT_EQ(std::get<std::int64_t>(*attr(g, ids::device(7), "vendor-id")), 2);
}

TEST(GraphBuilder, DeviceWithoutKnownSubnetGetsSlash24) {
  std::vector<Fact> facts;
  facts.emplace_back(DeviceFact(7, BacnetAddress::from_ip(ip("10.0.3.7")), 1));
  auto g = build_graph(facts);
  const auto subnet = ids::subnet(parse_subnet("10.0.3.0/24"));
  EXPECT_TRUE(g.contains(subnet));
  EXPECT_TRUE(has_edge(g, EdgeKind::DeviceOnSubnet, ids::device(7), subnet));
  EXPECT_FALSE(g.contains(ids::root()));
}

TEST(GraphBuilder, ConfiguredSubnetIsPreferred) {
  std::vector<Fact> facts;
  facts.emplace_back(SubnetFact(parse_subnet("10.0.0.0/16")));
  facts.emplace_back(DeviceFact(7, BacnetAddress::from_ip(ip("10.0.3.7")), 1));
  auto g = build_graph(facts);
  EXPECT_TRUE(has_edge(g, EdgeKind::DeviceOnSubnet, ids::device(7), ids::subnet(parse_subnet("10.0.0.0/16"))));
  EXPECT_FALSE(g.contains(ids::subnet(parse_subnet("10.0.3.0/24"))));
}

TEST(GraphBuilder, RouterOutsideKnownSubnetsLinksToRoot) {
  auto facts = make_site_facts();
  facts.emplace_back(RouterFact(ip("10.5.5.1"), {3000}));
  auto g = build_graph(facts);
  const auto router = ids::router(ip("10.5.5.1"));
  EXPECT_TRUE(has_edge(g, EdgeKind::RootLink, ids::root(), router));
  EXPECT_TRUE(has_edge(g, EdgeKind::RouterToNetwork, router, ids::network(3000)));
}

TEST(GraphBuilder, DistributorsAndBdt) {
  auto facts = make_site_facts();
  facts.emplace_back(DistributorFact(ip("192.168.1.20"), {ip("192.168.1.20"), ip("10.0.0.5")}));
  facts.emplace_back(DistributorFact(ip("10.0.0.5"), {ip("192.168.1.20")}));
  auto g = build_graph(facts);

  const auto local = ids::device(100);
  const auto remote = ids::distributor(ip("10.0.0.5"));
  ASSERT_TRUE(g.contains(remote));
  // The device answering at the BBMD address keeps its id and becomes a BBMD.
  EXPECT_EQ(g.find(local)->kind, EntityKind::BroadcastDistributor);
  EXPECT_EQ(g.find(remote)->kind, EntityKind::BroadcastDistributor);

  EXPECT_TRUE(has_edge(g, EdgeKind::BdtEntry, local, remote));
  EXPECT_TRUE(has_edge(g, EdgeKind::BdtEntry, remote, local));
  EXPECT_TRUE(has_edge(g, EdgeKind::BbmdBroadcastDomain, remote, ids::subnet(parse_subnet("10.0.0.0/24"))));
  EXPECT_TRUE(has_edge(g, EdgeKind::BbmdBroadcastDomain, local, ids::subnet(parse_subnet("192.168.1.0/24"))));
}

TEST(GraphBuilder, SelfBdtEntrySetsFlagWithoutSelfEdge) {
  std::vector<Fact> facts;
  facts.emplace_back(DistributorFact(ip("10.0.0.5"), {ip("10.0.0.5")}));
  auto g = build_graph(facts);
  const auto id = ids::distributor(ip("10.0.0.5"));
  const auto* flag = attr(g, id, "bdt-enabled");
  ASSERT_NE(flag, nullptr);
  EXPECT_TRUE(std::get<bool>(*flag));
  EXPECT_FALSE(has_edge(g, EdgeKind::BdtEntry, id, id));
  EXPECT_EQ(std::get<std::int64_t>(*attr(g, id, "bdt-size")), 1);
}

TEST(GraphBuilder, UnknownBdtPeerIsDropped) {
  std::vector<Fact> facts;
  facts.emplace_back(DistributorFact(ip("10.0.0.5"), {ip("10.9.9.9")}));
  auto g = build_graph(facts);
  EXPECT_FALSE(g.contains(ids::distributor(ip("10.9.9.9"))));
  for (const auto& e : g.edges()) EXPECT_NE(e.kind, EdgeKind::BdtEntry);
}

TEST(GraphBuilder, ClosestDistributorLinksRoot) {
  auto facts = make_site_facts();
  facts.emplace_back(DistributorFact(ip("192.168.1.20"), {ip("192.168.1.20")}));
  std::get<ScannerFact>(facts.front()).closest_distributor = ip("192.168.1.20");
  auto g = build_graph(facts);
  EXPECT_TRUE(has_edge(g, EdgeKind::RootLink, ids::root(), ids::device(100)));
  EXPECT_EQ(std::get<std::string>(*attr(g, ids::root(), "closest-bbmd")), ids::device(100));
}

TEST(GraphBuilder, EmptyFactsGiveEmptyGraph) {
  auto g = build_graph({}, BuildOptions{"empty", ""});
  EXPECT_TRUE(g.empty());
  EXPECT_EQ(g.num_edges(), 0);
}
