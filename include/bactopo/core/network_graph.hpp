/* Immutable topology snapshot with CSR and reverse CSR adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bactopo/core/types.hpp"

namespace bactopo::core {

using NodeIndex = std::int32_t;
using EdgeIndex = std::int32_t;

// Notes on identity:
// - Entities are addressed externally by their string id. Internally each
//   entity has a NodeIndex, its position after sorting by id, so index order
//   and id order coincide and traversals are reproducible.
// - Edges are sorted by (kind, from, to) and duplicates are collapsed; an
//   EdgeIndex is a position in that order.
class NetworkGraph {
public:
  NetworkGraph() = default;

  // Validates and compacts the parts. Throws ValueError on an empty or
  // duplicate entity id, or on an edge whose endpoint is not an entity.
  [[nodiscard]] static NetworkGraph from_parts(
      std::string name,
      std::string timestamp,
      std::vector<Entity> entities,
      std::vector<Edge> edges);
  ~NetworkGraph() noexcept = default;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::string& timestamp() const noexcept { return timestamp_; }

  [[nodiscard]] std::int32_t num_entities() const noexcept { return static_cast<std::int32_t>(entities_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(edges_.size()); }
  [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }

  [[nodiscard]] std::span<const Entity> entities() const noexcept { return entities_; }
  [[nodiscard]] std::span<const Edge> edges() const noexcept { return edges_; }
  [[nodiscard]] std::span<const NodeIndex> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeIndex> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeIndex> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const EdgeIndex> adj_edge_index_view() const noexcept { return adj_edge_index_; }
  [[nodiscard]] std::span<const std::int32_t> in_row_offsets_view() const noexcept { return in_row_offsets_; }
  [[nodiscard]] std::span<const NodeIndex> in_col_indices_view() const noexcept { return in_col_indices_; }
  [[nodiscard]] std::span<const EdgeIndex> in_adj_edge_index_view() const noexcept { return in_adj_edge_index_; }

  [[nodiscard]] std::optional<NodeIndex> index_of(std::string_view id) const noexcept;
  [[nodiscard]] const Entity* find(std::string_view id) const noexcept;
  [[nodiscard]] bool contains(std::string_view id) const noexcept { return index_of(id).has_value(); }
  [[nodiscard]] bool contains(const Edge& e) const noexcept;
  [[nodiscard]] std::vector<std::string> entity_ids() const;

  // Outgoing / incoming edges of an entity in (kind, from, to) order.
  // Unknown ids yield an empty result.
  [[nodiscard]] std::vector<Edge> out_edges(std::string_view id) const;
  [[nodiscard]] std::vector<Edge> in_edges(std::string_view id) const;

  // Breadth-first search over the undirected view of the graph. Returns the
  // id of the closest entity of `kind` (excluding `from` itself); ties at the
  // same hop count resolve to the smallest id.
  [[nodiscard]] std::optional<std::string> nearest(std::string_view from, EntityKind kind) const;
  // Undirected hop count between two entities, nullopt if disconnected.
  [[nodiscard]] std::optional<std::int32_t> hop_distance(std::string_view a, std::string_view b) const;

  // Structural equality: entities (with labels and attributes) and edges.
  // Name and timestamp are snapshot metadata and do not take part.
  friend bool operator==(const NetworkGraph& a, const NetworkGraph& b) noexcept {
    return a.entities_ == b.entities_ && a.edges_ == b.edges_;
  }

private:
  [[nodiscard]] std::vector<std::int32_t> bfs_levels(NodeIndex src) const;

  std::string name_ {};
  std::string timestamp_ {};
  std::vector<Entity> entities_ {};  // sorted by id
  std::vector<Edge> edges_ {};       // sorted by (kind, from, to), unique
  std::vector<NodeIndex> src_ {};
  std::vector<NodeIndex> dst_ {};

  // CSR adjacency for deterministic traversal
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeIndex> col_indices_ {};
  std::vector<EdgeIndex> adj_edge_index_ {};  // map CSR entry -> EdgeIndex
  // Reverse CSR (incoming adjacency)
  std::vector<std::int32_t> in_row_offsets_ {};
  std::vector<NodeIndex> in_col_indices_ {};
  std::vector<EdgeIndex> in_adj_edge_index_ {};
};

} // namespace bactopo::core
