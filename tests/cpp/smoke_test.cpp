#include <gtest/gtest.h>
#include "bactopo/core/graph_builder.hpp"
#include "bactopo/core/graph_diff.hpp"
#include "test_utils.hpp"

using namespace bactopo::core;
using namespace bactopo::core::test;

TEST(GraphSmoke, BuildAndDiffSite) {
  auto facts = make_site_facts();
  auto g = build_graph(facts, BuildOptions{"site", "2024-01-01T00:00:00Z"});
  EXPECT_EQ(g.name(), "site");
  EXPECT_TRUE(g.contains(ids::root()));
  EXPECT_TRUE(g.contains(ids::device(100)));
  EXPECT_TRUE(g.contains(ids::network(2001)));

  auto d = diff(g, g);
  EXPECT_EQ(d.entity_counts().unchanged, g.num_entities());
  EXPECT_EQ(d.edge_counts().unchanged, g.num_edges());
}
