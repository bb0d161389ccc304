#include "bactopo/core/snapshot_store.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "bactopo/core/error.hpp"
#include "bactopo/core/log.hpp"
#include "bactopo/core/turtle.hpp"

namespace bactopo::core {

namespace fs = std::filesystem;

namespace {

// Ids are plain file names; anything that could escape the directory is refused.
void check_file_name(const std::string& name) {
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos ||
      name.find('\\') != std::string::npos) {
    throw ValueError("invalid snapshot name '" + name + "'");
  }
}

std::string read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) throw RuntimeError("The file '" + p.filename().string() + "' does not exist");
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Written beside the target and renamed over it, so readers never see a
// partial file.
void write_file(const fs::path& p, const std::string& text) {
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw RuntimeError("cannot write " + tmp.string());
    out << text;
    if (!out.flush()) throw RuntimeError("cannot write " + tmp.string());
  }
  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) throw RuntimeError("cannot publish " + p.string() + ": " + ec.message());
}

std::vector<std::string> list_dir(const fs::path& dir) {
  std::vector<std::string> out;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) continue;
    auto name = entry.path().filename().string();
    if (name.ends_with(".tmp")) continue;
    out.push_back(std::move(name));
  }
  if (ec) throw RuntimeError("cannot list " + dir.string() + ": " + ec.message());
  std::sort(out.begin(), out.end());
  return out;
}

std::string stem(const std::string& id) {
  if (id.ends_with(".ttl")) return id.substr(0, id.size() - 4);
  return id;
}

} // namespace

FileSnapshotStore::FileSnapshotStore(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_ / "ttl", ec);
  if (!ec) fs::create_directories(root_ / "compare", ec);
  if (ec) throw RuntimeError("cannot create store at " + root_.string() + ": " + ec.message());
}

fs::path FileSnapshotStore::snapshot_path(const std::string& id) const {
  check_file_name(id);
  return root_ / "ttl" / id;
}

NetworkGraph FileSnapshotStore::load(const std::string& id) {
  auto p = snapshot_path(id);
  if (!fs::exists(p)) throw RuntimeError("The file '" + id + "' does not exist");
  return read_turtle(read_file(p), id);
}

fs::path FileSnapshotStore::save(const std::string& id, const NetworkGraph& g) {
  auto p = snapshot_path(id);
  write_file(p, write_turtle(g));
  logger()->debug("saved snapshot {}", p.string());
  return p;
}

std::string FileSnapshotStore::diff_name(const ComparePair& pair) {
  return stem(pair.source_a) + "_vs_" + stem(pair.source_b) + ".ttl";
}

std::string FileSnapshotStore::save_diff(const ComparePair& pair, const DiffGraph& diff) {
  auto name = diff_name(pair);
  check_file_name(name);
  auto p = root_ / "compare" / name;
  write_file(p, write_turtle(diff));
  logger()->info("saved comparison {}", p.string());
  return p.string();
}

DiffGraph FileSnapshotStore::load_diff(const std::string& name) const {
  check_file_name(name);
  auto p = root_ / "compare" / name;
  if (!fs::exists(p)) throw RuntimeError("The file '" + name + "' does not exist");
  return read_diff_turtle(read_file(p));
}

std::vector<std::string> FileSnapshotStore::list() const { return list_dir(root_ / "ttl"); }

std::vector<std::string> FileSnapshotStore::list_diffs() const { return list_dir(root_ / "compare"); }

std::size_t FileSnapshotStore::prune(std::size_t limit) {
  auto names = list();
  if (names.size() <= limit) return 0;
  std::vector<std::pair<fs::file_time_type, std::string>> aged;
  aged.reserve(names.size());
  for (auto& n : names) {
    std::error_code ec;
    auto t = fs::last_write_time(root_ / "ttl" / n, ec);
    aged.emplace_back(ec ? fs::file_time_type::min() : t, std::move(n));
  }
  std::sort(aged.begin(), aged.end());
  const auto excess = aged.size() - limit;
  std::size_t removed = 0;
  for (std::size_t i = 0; i < excess; ++i) {
    std::error_code ec;
    if (fs::remove(root_ / "ttl" / aged[i].second, ec)) {
      ++removed;
    } else if (ec) {
      logger()->warn("cannot prune {}: {}", aged[i].second, ec.message());
    }
  }
  if (removed > 0) logger()->info("pruned {} snapshot(s), limit {}", removed, limit);
  return removed;
}

} // namespace bactopo::core
