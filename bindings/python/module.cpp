/*
  Pybind11 module exposing bactopo core APIs to Python.

  Notes:
    - Attribute values map to bool / int / str.
    - CSR adjacency views are returned as int32 NumPy arrays that keep the
      owning graph alive. Treat them as read-only.
    - Turtle parsing, diffing and queue waits release the GIL.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "bactopo/core/compare_queue.hpp"
#include "bactopo/core/discovery.hpp"
#include "bactopo/core/error.hpp"
#include "bactopo/core/graph_builder.hpp"
#include "bactopo/core/graph_diff.hpp"
#include "bactopo/core/network_graph.hpp"
#include "bactopo/core/scan_config.hpp"
#include "bactopo/core/snapshot_store.hpp"
#include "bactopo/core/turtle.hpp"
#include "bactopo/core/types.hpp"

namespace py = pybind11;
using namespace bactopo::core;

// int32 array over graph-owned storage; `owner` keeps the graph alive.
static py::array int32_view(py::object owner, std::span<const std::int32_t> s) {
  py::array arr(py::buffer_info(const_cast<std::int32_t*>(s.data()), sizeof(std::int32_t),
                                py::format_descriptor<std::int32_t>::format(), 1,
                                { s.size() }, { sizeof(std::int32_t) }),
                owner);
  return arr;
}

static py::dict attributes_to_dict(const Attributes& attrs) {
  py::dict d;
  for (const auto& [k, v] : attrs) {
    std::visit([&d, &k](const auto& x) { d[py::str(k)] = x; }, v);
  }
  return d;
}

static py::tuple edge_tuple(const Edge& e) {
  return py::make_tuple(std::string(to_string(e.kind)), e.from, e.to);
}

PYBIND11_MODULE(_bactopo_core, m) {
  m.doc() = "bactopo C++ bindings";

  py::register_exception<ValueError>(m, "ValueError", PyExc_ValueError);
  py::register_exception<RuntimeError>(m, "RuntimeError", PyExc_RuntimeError);

  py::enum_<EntityKind>(m, "EntityKind")
      .value("DEVICE", EntityKind::Device)
      .value("ROUTER", EntityKind::Router)
      .value("NETWORK", EntityKind::Network)
      .value("SUBNET", EntityKind::Subnet)
      .value("BBMD", EntityKind::BroadcastDistributor)
      .value("ROOT", EntityKind::Root);

  py::enum_<Provenance>(m, "Provenance")
      .value("REMOVED", Provenance::Removed)
      .value("ADDED", Provenance::Added)
      .value("UNCHANGED", Provenance::Unchanged);

  py::enum_<TaskState>(m, "TaskState")
      .value("QUEUED", TaskState::Queued)
      .value("PROCESSING", TaskState::Processing)
      .value("DONE", TaskState::Done)
      .value("ERROR", TaskState::Error);

  py::class_<NetworkGraph>(m, "NetworkGraph")
      .def_property_readonly("name", &NetworkGraph::name)
      .def_property_readonly("timestamp", &NetworkGraph::timestamp)
      .def("num_entities", &NetworkGraph::num_entities)
      .def("num_edges", &NetworkGraph::num_edges)
      .def("entity_ids", &NetworkGraph::entity_ids)
      .def("contains", [](const NetworkGraph& g, const std::string& id) { return g.contains(id); })
      .def("entity", [](const NetworkGraph& g, const std::string& id) -> py::object {
        const auto* e = g.find(id);
        if (!e) return py::none();
        py::dict d;
        d["id"] = e->id;
        d["kind"] = e->kind;
        d["label"] = e->label;
        d["attributes"] = attributes_to_dict(e->attributes);
        return std::move(d);
      })
      .def("edges", [](const NetworkGraph& g) {
        py::list out;
        for (const auto& e : g.edges()) out.append(edge_tuple(e));
        return out;
      })
      .def("nearest", [](const NetworkGraph& g, const std::string& from, EntityKind kind) {
        return g.nearest(from, kind);
      }, py::arg("from_id"), py::arg("kind"))
      .def("hop_distance", [](const NetworkGraph& g, const std::string& a, const std::string& b) {
        return g.hop_distance(a, b);
      })
      .def("row_offsets_view", [](py::object self) { return int32_view(self, self.cast<const NetworkGraph&>().row_offsets_view()); })
      .def("col_indices_view", [](py::object self) { return int32_view(self, self.cast<const NetworkGraph&>().col_indices_view()); })
      .def("adj_edge_index_view", [](py::object self) { return int32_view(self, self.cast<const NetworkGraph&>().adj_edge_index_view()); })
      .def("in_row_offsets_view", [](py::object self) { return int32_view(self, self.cast<const NetworkGraph&>().in_row_offsets_view()); })
      .def("in_col_indices_view", [](py::object self) { return int32_view(self, self.cast<const NetworkGraph&>().in_col_indices_view()); })
      .def("__eq__", [](const NetworkGraph& a, const NetworkGraph& b) { return a == b; });

  py::class_<DiffGraph>(m, "DiffGraph")
      .def("graph", &DiffGraph::graph, py::return_value_policy::reference_internal)
      .def_property_readonly("source_a", &DiffGraph::source_a)
      .def_property_readonly("source_b", &DiffGraph::source_b)
      .def("provenance", [](const DiffGraph& d, const std::string& id) { return d.provenance(id); })
      .def("ids_with", &DiffGraph::ids_with)
      .def("edges_with", [](const DiffGraph& d, Provenance p) {
        py::list out;
        for (const auto& e : d.edges_with(p)) out.append(edge_tuple(e));
        return out;
      })
      .def("entity_counts", [](const DiffGraph& d) {
        auto c = d.entity_counts();
        return py::make_tuple(c.removed, c.added, c.unchanged);
      })
      .def("edge_counts", [](const DiffGraph& d) {
        auto c = d.edge_counts();
        return py::make_tuple(c.removed, c.added, c.unchanged);
      });

  m.def("diff",
        [](const NetworkGraph& a, const NetworkGraph& b, std::string source_a, std::string source_b) {
          DiffOptions opts;
          opts.source_a = std::move(source_a);
          opts.source_b = std::move(source_b);
          py::gil_scoped_release release;
          return diff(a, b, opts);
        },
        py::arg("a"), py::arg("b"), py::arg("source_a") = "", py::arg("source_b") = "");

  m.def("plan_batches",
        [](std::uint32_t low, std::uint32_t high, std::uint32_t batch_size,
           const std::set<std::uint32_t>& known, std::uint32_t full_step) {
          py::list out;
          for (const auto& r : plan_batches(low, high, batch_size, known, full_step)) {
            out.append(py::make_tuple(r.low, r.high));
          }
          return out;
        },
        py::arg("low"), py::arg("high"), py::arg("batch_size"),
        py::arg("known") = std::set<std::uint32_t>{}, py::arg("full_step") = 1);

  m.def("known_device_instances", &known_device_instances, py::arg("graph"));

  m.def("read_turtle",
        [](const std::string& text, std::string name) {
          py::gil_scoped_release release;
          return read_turtle(text, std::move(name));
        },
        py::arg("text"), py::arg("name") = "");
  m.def("read_diff_turtle", [](const std::string& text) {
    py::gil_scoped_release release;
    return read_diff_turtle(text);
  });
  m.def("write_turtle", py::overload_cast<const NetworkGraph&>(&write_turtle));
  m.def("write_diff_turtle", py::overload_cast<const DiffGraph&>(&write_turtle));

  m.def("scan_config_defaults", [] { return to_json(ScanConfig{}).dump(); });
  m.def("validate_scan_config", [](const std::string& text) { return to_json(parse_scan_config(text)).dump(); });

  py::class_<FileSnapshotStore, std::shared_ptr<FileSnapshotStore>>(m, "FileSnapshotStore")
      .def(py::init<std::filesystem::path>(), py::arg("root"))
      .def("load", &FileSnapshotStore::load)
      .def("save", &FileSnapshotStore::save)
      .def("load_diff", &FileSnapshotStore::load_diff)
      .def("list", &FileSnapshotStore::list)
      .def("list_diffs", &FileSnapshotStore::list_diffs)
      .def("prune", &FileSnapshotStore::prune);

  py::class_<CompareQueue>(m, "CompareQueue")
      .def(py::init([](std::shared_ptr<FileSnapshotStore> store) {
        return std::make_unique<CompareQueue>(make_store_job(std::move(store)));
      }), py::arg("store"))
      .def("submit", [](CompareQueue& q, std::string a, std::string b) {
        auto r = q.submit(ComparePair{std::move(a), std::move(b)});
        return py::make_tuple(r.accepted, r.task_id);
      })
      .def("poll", [](const CompareQueue& q) { return to_json(q.poll()).dump(); })
      .def("state", [](const CompareQueue& q, TaskId id) -> py::object {
        auto t = q.task(id);
        if (!t) return py::none();
        return py::make_tuple(t->state, t->error);
      })
      .def("cancel", [](CompareQueue& q, TaskId id) { return q.cancel(id) == CancelResult::Removed; })
      .def("wait_idle", [](CompareQueue& q) {
        py::gil_scoped_release release;
        q.wait_idle();
      });
}
