/* Provenance-tagged union of two snapshots. */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bactopo/core/network_graph.hpp"
#include "bactopo/core/types.hpp"

namespace bactopo::core {

struct DiffCounts {
  std::int32_t removed {0};
  std::int32_t added {0};
  std::int32_t unchanged {0};
};

// DiffGraph wraps the union graph together with one Provenance per entity and
// per edge, stored in parallel with the graph's (sorted) entity and edge
// arrays. It is never mutated after construction.
class DiffGraph {
public:
  DiffGraph() = default;

  // Throws ValueError when the provenance arrays do not match the graph.
  [[nodiscard]] static DiffGraph from_parts(
      NetworkGraph graph,
      std::vector<Provenance> entity_provenance,
      std::vector<Provenance> edge_provenance,
      std::string source_a,
      std::string source_b);

  [[nodiscard]] const NetworkGraph& graph() const noexcept { return graph_; }
  [[nodiscard]] const std::string& source_a() const noexcept { return source_a_; }
  [[nodiscard]] const std::string& source_b() const noexcept { return source_b_; }

  [[nodiscard]] std::span<const Provenance> entity_provenance_view() const noexcept { return entity_prov_; }
  [[nodiscard]] std::span<const Provenance> edge_provenance_view() const noexcept { return edge_prov_; }

  // nullopt when the id / edge is in neither input.
  [[nodiscard]] std::optional<Provenance> provenance(std::string_view id) const noexcept;
  [[nodiscard]] std::optional<Provenance> provenance(const Edge& e) const noexcept;

  [[nodiscard]] std::vector<std::string> ids_with(Provenance p) const;
  [[nodiscard]] std::vector<Edge> edges_with(Provenance p) const;
  [[nodiscard]] DiffCounts entity_counts() const noexcept;
  [[nodiscard]] DiffCounts edge_counts() const noexcept;

  // Originating source for an element: source_a for removed, source_b for
  // added, empty for unchanged.
  [[nodiscard]] const std::string& source_of(Provenance p) const noexcept;

private:
  NetworkGraph graph_ {};
  std::vector<Provenance> entity_prov_ {};
  std::vector<Provenance> edge_prov_ {};
  std::string source_a_ {};
  std::string source_b_ {};
};

struct DiffOptions {
  std::string source_a {};  // identifier recorded as the origin of removed elements
  std::string source_b {};  // identifier recorded as the origin of added elements
  std::string name {};
  std::string timestamp {};
};

// Entities match by id and edges by (kind, from, to), nothing else. Ids only
// in `a` are Removed, only in `b` Added, in both Unchanged with b's label and
// attributes. The result's entity and edge sets are the union of the inputs.
[[nodiscard]] DiffGraph diff(const NetworkGraph& a, const NetworkGraph& b, const DiffOptions& opts = {});

} // namespace bactopo::core
