/*
  Snapshot storage boundary.

  SnapshotStore is the seam the compare worker loads from and saves into;
  FileSnapshotStore lays files out as the agent data directory does:
    <root>/ttl/<id>                 snapshots
    <root>/compare/<a>_vs_<b>.ttl   diffs (".ttl" stripped from a and b)
*/
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "bactopo/core/graph_diff.hpp"
#include "bactopo/core/network_graph.hpp"

namespace bactopo::core {

// Two snapshot ids to compare. Equality is ordered; same_pair() is not.
struct ComparePair {
  std::string source_a {};
  std::string source_b {};

  [[nodiscard]] bool same_pair(const ComparePair& o) const noexcept {
    return (source_a == o.source_a && source_b == o.source_b) ||
           (source_a == o.source_b && source_b == o.source_a);
  }
  friend bool operator==(const ComparePair&, const ComparePair&) = default;
};

class SnapshotStore {
public:
  virtual ~SnapshotStore() noexcept = default;

  // Throws RuntimeError when the snapshot does not exist, ParseError when it
  // cannot be read.
  [[nodiscard]] virtual NetworkGraph load(const std::string& id) = 0;
  // Returns where the diff was stored.
  virtual std::string save_diff(const ComparePair& pair, const DiffGraph& diff) = 0;
};

using SnapshotStorePtr = std::shared_ptr<SnapshotStore>;

class FileSnapshotStore final : public SnapshotStore {
public:
  // Creates <root>/ttl and <root>/compare when missing.
  explicit FileSnapshotStore(std::filesystem::path root);

  [[nodiscard]] NetworkGraph load(const std::string& id) override;
  std::string save_diff(const ComparePair& pair, const DiffGraph& diff) override;

  std::filesystem::path save(const std::string& id, const NetworkGraph& g);
  [[nodiscard]] DiffGraph load_diff(const std::string& name) const;

  // File names, sorted.
  [[nodiscard]] std::vector<std::string> list() const;
  [[nodiscard]] std::vector<std::string> list_diffs() const;

  // Deletes the oldest snapshots (by modification time, then name) until at
  // most `limit` remain. Returns how many were removed.
  std::size_t prune(std::size_t limit);

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

  // "<a>_vs_<b>.ttl" with a trailing ".ttl" removed from each id.
  [[nodiscard]] static std::string diff_name(const ComparePair& pair);

private:
  [[nodiscard]] std::filesystem::path snapshot_path(const std::string& id) const;

  std::filesystem::path root_;
};

} // namespace bactopo::core
