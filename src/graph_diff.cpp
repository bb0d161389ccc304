/*
  Graph differ: merge-join over two compacted snapshots.

  Both inputs keep entities sorted by id and edges sorted by (kind, from,
  to), so a single linear pass over each pair of arrays classifies every
  element. No hashing or iteration-order tie-breaks are involved; the output
  is identical on every call for the same inputs.
*/
#include "bactopo/core/graph_diff.hpp"

#include <algorithm>

#include "bactopo/core/error.hpp"

namespace bactopo::core {

DiffGraph DiffGraph::from_parts(
    NetworkGraph graph,
    std::vector<Provenance> entity_provenance,
    std::vector<Provenance> edge_provenance,
    std::string source_a,
    std::string source_b) {
  if (entity_provenance.size() != static_cast<std::size_t>(graph.num_entities())) {
    throw ValueError("entity provenance length does not match the graph");
  }
  if (edge_provenance.size() != static_cast<std::size_t>(graph.num_edges())) {
    throw ValueError("edge provenance length does not match the graph");
  }
  DiffGraph d;
  d.graph_ = std::move(graph);
  d.entity_prov_ = std::move(entity_provenance);
  d.edge_prov_ = std::move(edge_provenance);
  d.source_a_ = std::move(source_a);
  d.source_b_ = std::move(source_b);
  return d;
}

std::optional<Provenance> DiffGraph::provenance(std::string_view id) const noexcept {
  auto idx = graph_.index_of(id);
  if (!idx) return std::nullopt;
  return entity_prov_[static_cast<std::size_t>(*idx)];
}

std::optional<Provenance> DiffGraph::provenance(const Edge& e) const noexcept {
  auto edges = graph_.edges();
  auto it = std::lower_bound(edges.begin(), edges.end(), e);
  if (it == edges.end() || !(*it == e)) return std::nullopt;
  return edge_prov_[static_cast<std::size_t>(it - edges.begin())];
}

std::vector<std::string> DiffGraph::ids_with(Provenance p) const {
  std::vector<std::string> out;
  auto entities = graph_.entities();
  for (std::size_t i = 0; i < entities.size(); ++i) {
    if (entity_prov_[i] == p) out.push_back(entities[i].id);
  }
  return out;
}

std::vector<Edge> DiffGraph::edges_with(Provenance p) const {
  std::vector<Edge> out;
  auto edges = graph_.edges();
  for (std::size_t i = 0; i < edges.size(); ++i) {
    if (edge_prov_[i] == p) out.push_back(edges[i]);
  }
  return out;
}

namespace {
DiffCounts count(std::span<const Provenance> prov) noexcept {
  DiffCounts c;
  for (auto p : prov) {
    switch (p) {
      case Provenance::Removed: ++c.removed; break;
      case Provenance::Added: ++c.added; break;
      case Provenance::Unchanged: ++c.unchanged; break;
    }
  }
  return c;
}
} // namespace

DiffCounts DiffGraph::entity_counts() const noexcept { return count(entity_prov_); }
DiffCounts DiffGraph::edge_counts() const noexcept { return count(edge_prov_); }

const std::string& DiffGraph::source_of(Provenance p) const noexcept {
  static const std::string kNone;
  if (p == Provenance::Removed) return source_a_;
  if (p == Provenance::Added) return source_b_;
  return kNone;
}

DiffGraph diff(const NetworkGraph& a, const NetworkGraph& b, const DiffOptions& opts) {
  const auto ea = a.entities();
  const auto eb = b.entities();
  std::vector<Entity> entities;
  std::vector<Provenance> entity_prov;
  entities.reserve(ea.size() + eb.size());
  entity_prov.reserve(ea.size() + eb.size());
  std::size_t i = 0, j = 0;
  while (i < ea.size() || j < eb.size()) {
    if (j == eb.size() || (i < ea.size() && ea[i].id < eb[j].id)) {
      entities.push_back(ea[i++]);
      entity_prov.push_back(Provenance::Removed);
    } else if (i == ea.size() || eb[j].id < ea[i].id) {
      entities.push_back(eb[j++]);
      entity_prov.push_back(Provenance::Added);
    } else {
      // Present in both: newer values win.
      entities.push_back(eb[j]);
      entity_prov.push_back(Provenance::Unchanged);
      ++i; ++j;
    }
  }

  const auto xa = a.edges();
  const auto xb = b.edges();
  std::vector<Edge> edges;
  std::vector<Provenance> edge_prov;
  edges.reserve(xa.size() + xb.size());
  edge_prov.reserve(xa.size() + xb.size());
  i = 0; j = 0;
  while (i < xa.size() || j < xb.size()) {
    if (j == xb.size() || (i < xa.size() && xa[i] < xb[j])) {
      edges.push_back(xa[i++]);
      edge_prov.push_back(Provenance::Removed);
    } else if (i == xa.size() || xb[j] < xa[i]) {
      edges.push_back(xb[j++]);
      edge_prov.push_back(Provenance::Added);
    } else {
      edges.push_back(xb[j]);
      edge_prov.push_back(Provenance::Unchanged);
      ++i; ++j;
    }
  }

  // Already sorted and unique, so from_parts keeps this order and the
  // provenance arrays stay aligned with the graph's arrays.
  auto name = opts.name.empty() ? (opts.source_a + " vs " + opts.source_b) : opts.name;
  auto timestamp = opts.timestamp.empty() ? b.timestamp() : opts.timestamp;
  auto merged = NetworkGraph::from_parts(std::move(name), std::move(timestamp),
                                         std::move(entities), std::move(edges));
  return DiffGraph::from_parts(std::move(merged), std::move(entity_prov), std::move(edge_prov),
                               opts.source_a, opts.source_b);
}

} // namespace bactopo::core
