/*
  Turtle (RDF) rendering of snapshots and diffs.

  Snapshots are exchanged with external storage and the visualizer as
  Turtle text. The writer is deterministic: entities in id order, attributes
  in key order, edges grouped under their source entity. The reader accepts
  that output plus the common hand-edited forms (comments, ',' object lists,
  prefixed names, full IRIs, escaped strings, typed literals).
*/
#pragma once

#include <string>
#include <string_view>

#include "bactopo/core/graph_diff.hpp"
#include "bactopo/core/network_graph.hpp"

namespace bactopo::core {

inline constexpr std::string_view kBacnetNamespace = "http://data.ashrae.org/bacnet/2020#";
inline constexpr std::string_view kRdfNamespace = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view kRdfsNamespace = "http://www.w3.org/2000/01/rdf-schema#";
inline constexpr std::string_view kXsdNamespace = "http://www.w3.org/2001/XMLSchema#";

// Subject carrying snapshot name/timestamp (typed bacnet:Snapshot).
inline constexpr std::string_view kSnapshotSubject = "urn:bactopo:snapshot";
// Marks an added/removed entity or reified edge with the snapshot it came from.
inline constexpr std::string_view kDiffSourcePredicate = "rdf_diff_source";
// "added" or "removed" next to each rdf_diff_source mark. Readers trust it
// over the source id, which cannot decide when both snapshots share a name.
inline constexpr std::string_view kDiffProvenancePredicate = "diff-provenance";

[[nodiscard]] std::string write_turtle(const NetworkGraph& g);
// Union graph plus bacnet:rdf_diff_source and bacnet:diff-provenance on
// added/removed entities, and one reified statement per added/removed edge.
[[nodiscard]] std::string write_turtle(const DiffGraph& d);

// Throws ParseError on malformed text. `name` overrides the name recorded in
// the document when non-empty. Edges to subjects that are not typed entities
// are dropped with a warning.
[[nodiscard]] NetworkGraph read_turtle(std::string_view text, std::string name = {});
// Requires the bacnet:diff-source-a/-b header written by write_turtle(DiffGraph).
// Without bacnet:diff-provenance a mark is classified by its source, which
// throws ParseError when the two sources are equal or the source is unknown.
[[nodiscard]] DiffGraph read_diff_turtle(std::string_view text);

} // namespace bactopo::core
