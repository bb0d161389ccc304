/**
 * @file bactopo_cli.cpp
 * @brief Command line front end for scans and comparisons.
 *
 *   bactopo scan    --config=PATH (--out=FILE | --store=DIR) [--name=ID] [--previous=FILE]
 *   bactopo diff    --a=FILE --b=FILE --out=FILE
 *   bactopo compare --store=DIR --a=ID --b=ID
 *   bactopo config  [--config=PATH]
 */

#include <cstdio>
#include <cstring>
#include <ctime>
#include <exception>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include "bactopo/core/compare_queue.hpp"
#include "bactopo/core/discovery.hpp"
#include "bactopo/core/error.hpp"
#include "bactopo/core/graph_builder.hpp"
#include "bactopo/core/graph_diff.hpp"
#include "bactopo/core/log.hpp"
#include "bactopo/core/scan_config.hpp"
#include "bactopo/core/snapshot_store.hpp"
#include "bactopo/core/turtle.hpp"

using namespace bactopo::core;

namespace {

struct Args {
  std::string command;
  std::string config;
  std::string out;
  std::string store;
  std::string name;
  std::string previous;
  std::string a;
  std::string b;
};

void usage(const char* prog) {
  std::fprintf(stderr,
      "Usage:\n"
      "  %s scan    --config=PATH (--out=FILE | --store=DIR) [--name=ID] [--previous=FILE]\n"
      "  %s diff    --a=FILE --b=FILE --out=FILE\n"
      "  %s compare --store=DIR --a=ID --b=ID\n"
      "  %s config  [--config=PATH]\n", prog, prog, prog, prog);
}

bool flag(const char* arg, const char* key, std::string& out) {
  const auto n = std::strlen(key);
  if (std::strncmp(arg, key, n) != 0) return false;
  out = arg + n;
  return true;
}

std::string utc_timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm {};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw RuntimeError("The file '" + path + "' does not exist");
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out || !(out << text)) throw RuntimeError("cannot write " + path);
}

int run_scan(const Args& args) {
  if (args.config.empty() || (args.out.empty() && args.store.empty())) return 2;
  const auto cfg = load_scan_config(args.config);
  set_log_level(cfg.log_level);

  auto transport = make_udp_transport(cfg.agent().endpoint);
  DiscoveryEngine engine(cfg, transport);
  if (!args.previous.empty()) engine.set_previous_snapshot(read_turtle(read_file(args.previous), args.previous));
  const auto result = engine.discover();

  const auto timestamp = utc_timestamp();
  const auto name = args.name.empty() ? "bacnet_graph_" + timestamp + ".ttl" : args.name;
  const auto graph = build_graph(result.facts, BuildOptions{name, timestamp});
  logger()->info("snapshot {}: {} entities, {} edges{}", name, graph.num_entities(), graph.num_edges(),
                 result.complete ? "" : " (some batches were not sent)");

  if (!args.out.empty()) write_file(args.out, write_turtle(graph));
  if (!args.store.empty()) {
    FileSnapshotStore store(args.store);
    store.save(name, graph);
    store.prune(cfg.graph_store_limit);
  }
  return result.complete ? 0 : 3;
}

int run_diff(const Args& args) {
  if (args.a.empty() || args.b.empty() || args.out.empty()) return 2;
  const auto a = read_turtle(read_file(args.a), args.a);
  const auto b = read_turtle(read_file(args.b), args.b);
  DiffOptions opts;
  opts.source_a = args.a;
  opts.source_b = args.b;
  const auto d = diff(a, b, opts);
  write_file(args.out, write_turtle(d));
  const auto ec = d.entity_counts();
  logger()->info("{} added, {} removed, {} unchanged entities", ec.added, ec.removed, ec.unchanged);
  return 0;
}

int run_compare(const Args& args) {
  if (args.store.empty() || args.a.empty() || args.b.empty()) return 2;
  auto store = std::make_shared<FileSnapshotStore>(args.store);
  CompareQueue queue(make_store_job(store));
  const auto submitted = queue.submit(ComparePair{args.a, args.b});
  queue.wait_idle();
  const auto task = queue.task(submitted.task_id);
  if (task) std::printf("%s\n", to_json(*task).dump(2).c_str());
  return task && task->state == TaskState::Done ? 0 : 1;
}

int run_config(const Args& args) {
  const auto cfg = args.config.empty() ? ScanConfig{} : load_scan_config(args.config);
  std::printf("%s\n", to_json(cfg).dump(2).c_str());
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    usage(argv[0]);
    return 2;
  }
  Args args;
  args.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    if (flag(argv[i], "--config=", args.config)) continue;
    if (flag(argv[i], "--out=", args.out)) continue;
    if (flag(argv[i], "--store=", args.store)) continue;
    if (flag(argv[i], "--previous=", args.previous)) continue;
    if (flag(argv[i], "--name=", args.name)) continue;
    if (flag(argv[i], "--a=", args.a)) continue;
    if (flag(argv[i], "--b=", args.b)) continue;
    std::fprintf(stderr, "unknown argument: %s\n", argv[i]);
    usage(argv[0]);
    return 2;
  }

  int rc = 2;
  try {
    if (args.command == "scan") rc = run_scan(args);
    else if (args.command == "diff") rc = run_diff(args);
    else if (args.command == "compare") rc = run_compare(args);
    else if (args.command == "config") rc = run_config(args);
  } catch (const std::exception& e) {
    logger()->error("{}: {}", args.command, e.what());
    return 1;
  }
  if (rc == 2) usage(argv[0]);
  return rc;
}
