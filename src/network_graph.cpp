/*
  NetworkGraph: immutable topology snapshot with deterministic layout.

  Construction validates ids and edge endpoints, collapses duplicate edges
  and compacts adjacency into CSR (and reverse CSR). Entities are sorted by
  id and edges by (kind, from, to), so two graphs built from the same parts
  in any order are laid out identically.
*/
#include "bactopo/core/network_graph.hpp"

#include <algorithm>
#include <deque>
#include <limits>

#include "bactopo/core/error.hpp"

namespace bactopo::core {

NetworkGraph NetworkGraph::from_parts(
    std::string name,
    std::string timestamp,
    std::vector<Entity> entities,
    std::vector<Edge> edges) {

  NetworkGraph g;
  g.name_ = std::move(name);
  g.timestamp_ = std::move(timestamp);

  std::sort(entities.begin(), entities.end(),
            [](const Entity& a, const Entity& b) { return a.id < b.id; });
  for (std::size_t i = 0; i < entities.size(); ++i) {
    if (entities[i].id.empty()) {
      throw ValueError("entity id must not be empty");
    }
    if (i > 0 && entities[i].id == entities[i - 1].id) {
      throw ValueError("duplicate entity id '" + entities[i].id + "'");
    }
  }
  g.entities_ = std::move(entities);

  std::sort(edges.begin(), edges.end());
  edges.erase(std::unique(edges.begin(), edges.end()), edges.end());

  const std::size_t m = edges.size();
  g.src_.resize(m);
  g.dst_.resize(m);
  for (std::size_t e = 0; e < m; ++e) {
    auto s = g.index_of(edges[e].from);
    auto d = g.index_of(edges[e].to);
    if (!s || !d) {
      throw ValueError("edge " + std::string(to_string(edges[e].kind)) + " '" + edges[e].from +
                       "' -> '" + edges[e].to + "' references an unknown entity");
    }
    g.src_[e] = *s;
    g.dst_[e] = *d;
  }
  g.edges_ = std::move(edges);

  const auto n = g.entities_.size();
  // Build CSR adjacency
  g.row_offsets_.assign(n + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g.row_offsets_[static_cast<std::size_t>(g.src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g.row_offsets_.size(); ++i) {
    g.row_offsets_[i] += g.row_offsets_[i - 1];
  }
  g.col_indices_.resize(m);
  g.adj_edge_index_.resize(m);
  std::vector<std::int32_t> cursor = g.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = g.src_[e];
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    g.col_indices_[pos] = g.dst_[e];
    g.adj_edge_index_[pos] = static_cast<EdgeIndex>(e);
  }
  // Build reverse CSR (incoming adjacency)
  g.in_row_offsets_.assign(n + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g.in_row_offsets_[static_cast<std::size_t>(g.dst_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g.in_row_offsets_.size(); ++i) {
    g.in_row_offsets_[i] += g.in_row_offsets_[i - 1];
  }
  g.in_col_indices_.resize(m);
  g.in_adj_edge_index_.resize(m);
  std::vector<std::int32_t> rcursor = g.in_row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto v = g.dst_[e];
    auto pos = static_cast<std::size_t>(rcursor[static_cast<std::size_t>(v)]++);
    g.in_col_indices_[pos] = g.src_[e];
    g.in_adj_edge_index_[pos] = static_cast<EdgeIndex>(e);
  }
  return g;
}

std::optional<NodeIndex> NetworkGraph::index_of(std::string_view id) const noexcept {
  auto it = std::lower_bound(entities_.begin(), entities_.end(), id,
                             [](const Entity& e, std::string_view key) { return e.id < key; });
  if (it == entities_.end() || it->id != id) return std::nullopt;
  return static_cast<NodeIndex>(it - entities_.begin());
}

const Entity* NetworkGraph::find(std::string_view id) const noexcept {
  auto idx = index_of(id);
  return idx ? &entities_[static_cast<std::size_t>(*idx)] : nullptr;
}

bool NetworkGraph::contains(const Edge& e) const noexcept {
  return std::binary_search(edges_.begin(), edges_.end(), e);
}

std::vector<std::string> NetworkGraph::entity_ids() const {
  std::vector<std::string> ids;
  ids.reserve(entities_.size());
  for (const auto& e : entities_) ids.push_back(e.id);
  return ids;
}

std::vector<Edge> NetworkGraph::out_edges(std::string_view id) const {
  std::vector<Edge> out;
  auto u = index_of(id);
  if (!u) return out;
  auto s = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(*u)]);
  auto e = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(*u) + 1]);
  for (std::size_t j = s; j < e; ++j) {
    out.push_back(edges_[static_cast<std::size_t>(adj_edge_index_[j])]);
  }
  return out;
}

std::vector<Edge> NetworkGraph::in_edges(std::string_view id) const {
  std::vector<Edge> out;
  auto v = index_of(id);
  if (!v) return out;
  auto s = static_cast<std::size_t>(in_row_offsets_[static_cast<std::size_t>(*v)]);
  auto e = static_cast<std::size_t>(in_row_offsets_[static_cast<std::size_t>(*v) + 1]);
  for (std::size_t j = s; j < e; ++j) {
    out.push_back(edges_[static_cast<std::size_t>(in_adj_edge_index_[j])]);
  }
  return out;
}

std::vector<std::int32_t> NetworkGraph::bfs_levels(NodeIndex src) const {
  constexpr auto kUnreached = std::numeric_limits<std::int32_t>::max();
  std::vector<std::int32_t> dist(entities_.size(), kUnreached);
  std::deque<NodeIndex> queue;
  dist[static_cast<std::size_t>(src)] = 0;
  queue.push_back(src);
  auto visit = [&](NodeIndex u, NodeIndex v) {
    auto& dv = dist[static_cast<std::size_t>(v)];
    if (dv == kUnreached) {
      dv = dist[static_cast<std::size_t>(u)] + 1;
      queue.push_back(v);
    }
  };
  while (!queue.empty()) {
    NodeIndex u = queue.front();
    queue.pop_front();
    auto uu = static_cast<std::size_t>(u);
    for (auto j = row_offsets_[uu]; j < row_offsets_[uu + 1]; ++j) {
      visit(u, col_indices_[static_cast<std::size_t>(j)]);
    }
    for (auto j = in_row_offsets_[uu]; j < in_row_offsets_[uu + 1]; ++j) {
      visit(u, in_col_indices_[static_cast<std::size_t>(j)]);
    }
  }
  return dist;
}

std::optional<std::string> NetworkGraph::nearest(std::string_view from, EntityKind kind) const {
  auto src = index_of(from);
  if (!src) return std::nullopt;
  auto dist = bfs_levels(*src);
  std::optional<std::size_t> best;
  for (std::size_t i = 0; i < entities_.size(); ++i) {
    if (static_cast<NodeIndex>(i) == *src || entities_[i].kind != kind) continue;
    if (dist[i] == std::numeric_limits<std::int32_t>::max()) continue;
    // Index order is id order, so the first hit at the minimum distance wins.
    if (!best || dist[i] < dist[*best]) best = i;
  }
  if (!best) return std::nullopt;
  return entities_[*best].id;
}

std::optional<std::int32_t> NetworkGraph::hop_distance(std::string_view a, std::string_view b) const {
  auto ia = index_of(a);
  auto ib = index_of(b);
  if (!ia || !ib) return std::nullopt;
  auto dist = bfs_levels(*ia);
  auto d = dist[static_cast<std::size_t>(*ib)];
  if (d == std::numeric_limits<std::int32_t>::max()) return std::nullopt;
  return d;
}

} // namespace bactopo::core
