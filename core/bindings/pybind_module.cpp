// PyBind11 bindings for the pagoracle C++ core.
// Exposes MixedEdgeGraph, path predicates, and the structural queries to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DPAGORACLE_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "graph/graph.hpp"
#include "graph/path.hpp"
#include "predicates/path_predicates.hpp"
#include "reachability/ancestral_reachability.hpp"
#include "separation/moralization.hpp"
#include "separation/separation_oracle.hpp"
#include "discovery/discriminating_path.hpp"
#include "discovery/pds.hpp"
#include "discovery/uncovered_path.hpp"

namespace py = pybind11;

PYBIND11_MODULE(pagoracle_bindings, m) {
    m.doc() = "pagoracle C++ Core Bindings";

    py::register_exception<pagoracle::UnknownNode>(m, "UnknownNode", PyExc_KeyError);
    py::register_exception<pagoracle::InvalidQuery>(m, "InvalidQuery", PyExc_ValueError);

    // ── Enums ──
    py::enum_<pagoracle::EdgeKind>(m, "EdgeKind")
        .value("DIRECTED", pagoracle::EdgeKind::Directed)
        .value("BIDIRECTED", pagoracle::EdgeKind::Bidirected)
        .value("UNDIRECTED", pagoracle::EdgeKind::Undirected)
        .value("CIRCLE", pagoracle::EdgeKind::Circle);

    py::enum_<pagoracle::EndpointMark>(m, "EndpointMark")
        .value("ARROW", pagoracle::EndpointMark::Arrow)
        .value("TAIL", pagoracle::EndpointMark::Tail)
        .value("CIRCLE", pagoracle::EndpointMark::Circle);

    py::enum_<pagoracle::SeparationStrategy>(m, "SeparationStrategy")
        .value("ANCESTRAL_MORALIZATION", pagoracle::SeparationStrategy::AncestralMoralization)
        .value("LEGAL_PATH", pagoracle::SeparationStrategy::LegalPath);

    // ── Edge ──
    py::class_<pagoracle::Edge>(m, "Edge")
        .def(py::init<>())
        .def_readwrite("source", &pagoracle::Edge::source)
        .def_readwrite("target", &pagoracle::Edge::target)
        .def_readwrite("kind", &pagoracle::Edge::kind)
        .def_readwrite("source_mark", &pagoracle::Edge::source_mark)
        .def_readwrite("target_mark", &pagoracle::Edge::target_mark);

    // ── Incidence ──
    py::class_<pagoracle::Incidence>(m, "Incidence")
        .def(py::init<>())
        .def_readwrite("neighbor", &pagoracle::Incidence::neighbor)
        .def_readwrite("kind", &pagoracle::Incidence::kind)
        .def_readwrite("mark_here", &pagoracle::Incidence::mark_here)
        .def_readwrite("mark_there", &pagoracle::Incidence::mark_there);

    // ── MixedEdgeGraph ──
    py::class_<pagoracle::MixedEdgeGraph>(m, "MixedEdgeGraph")
        .def(py::init<>())
        .def("add_node", py::overload_cast<const pagoracle::NodeId&>(
                 &pagoracle::MixedEdgeGraph::addNode))
        .def("remove_node", &pagoracle::MixedEdgeGraph::removeNode)
        .def("has_node", &pagoracle::MixedEdgeGraph::hasNode)
        .def("node_ids", &pagoracle::MixedEdgeGraph::nodeIds)
        .def("node_count", &pagoracle::MixedEdgeGraph::nodeCount)
        .def("add_edge", &pagoracle::MixedEdgeGraph::addEdge,
             py::arg("u"), py::arg("v"), py::arg("kind"))
        .def("add_edge_with_marks", &pagoracle::MixedEdgeGraph::addEdgeWithMarks,
             py::arg("u"), py::arg("v"), py::arg("mark_at_u"), py::arg("mark_at_v"))
        .def("remove_edge", &pagoracle::MixedEdgeGraph::removeEdge)
        .def("edge_count", &pagoracle::MixedEdgeGraph::edgeCount)
        .def("has_edge", &pagoracle::MixedEdgeGraph::hasEdge)
        .def("adjacent", &pagoracle::MixedEdgeGraph::adjacent)
        .def("mark_at", &pagoracle::MixedEdgeGraph::markAt)
        .def("neighbors", py::overload_cast<const pagoracle::NodeId&>(
                 &pagoracle::MixedEdgeGraph::neighbors, py::const_))
        .def("parents", &pagoracle::MixedEdgeGraph::parents)
        .def("children", &pagoracle::MixedEdgeGraph::children)
        .def("ancestors", &pagoracle::MixedEdgeGraph::ancestors)
        .def("descendants", &pagoracle::MixedEdgeGraph::descendants)
        .def("c_components", &pagoracle::MixedEdgeGraph::cComponents)
        .def("is_directed_acyclic", &pagoracle::MixedEdgeGraph::isDirectedAcyclic)
        .def("extract_subgraph", &pagoracle::MixedEdgeGraph::extractSubgraph)
        .def("transpose", &pagoracle::MixedEdgeGraph::transpose)
        .def("edges", &pagoracle::MixedEdgeGraph::edges);

    // ── Path ──
    py::class_<pagoracle::Path>(m, "Path")
        .def_static("from_nodes", &pagoracle::Path::fromNodes)
        .def_readonly("nodes", &pagoracle::Path::nodes)
        .def("length", &pagoracle::Path::length)
        .def("__str__", &pagoracle::Path::toString);

    // ── Predicates ──
    m.def("is_collider", &pagoracle::PathPredicates::isCollider);
    m.def("is_definite_noncollider", &pagoracle::PathPredicates::isDefiniteNonCollider);
    m.def("is_possibly_directed", py::overload_cast<const pagoracle::MixedEdgeGraph&,
              const pagoracle::NodeId&, const pagoracle::NodeId&>(
              &pagoracle::PathPredicates::isPossiblyDirected));
    m.def("is_covered_triple", &pagoracle::PathPredicates::isCoveredTriple);
    m.def("is_uncovered_path", &pagoracle::PathPredicates::isUncoveredPath);
    m.def("is_open_path", &pagoracle::PathPredicates::isOpenPath);

    // ── Reachability ──
    m.def("possible_ancestors", py::overload_cast<const pagoracle::MixedEdgeGraph&,
              const pagoracle::NodeId&>(&pagoracle::AncestralReachability::possibleAncestors));
    m.def("possible_descendants", py::overload_cast<const pagoracle::MixedEdgeGraph&,
              const pagoracle::NodeId&>(&pagoracle::AncestralReachability::possibleDescendants));
    m.def("possible_anteriors", &pagoracle::AncestralReachability::possibleAnteriors,
          py::arg("graph"), py::arg("sources"), py::arg("closed") = pagoracle::NodeSet{});

    // ── Separation ──
    py::class_<pagoracle::SeparationConfig>(m, "SeparationConfig")
        .def(py::init<>())
        .def_readwrite("strategy", &pagoracle::SeparationConfig::strategy);

    m.def("m_separated", [](const pagoracle::MixedEdgeGraph& graph,
                            const pagoracle::NodeSet& x, const pagoracle::NodeSet& y,
                            const pagoracle::NodeSet& z,
                            const pagoracle::SeparationConfig& config) {
        pagoracle::SeparationOracle oracle(config);
        return oracle.mSeparated(graph, x, y, z);
    }, py::arg("graph"), py::arg("x"), py::arg("y"), py::arg("z"),
       py::arg("config") = pagoracle::SeparationConfig{});

    m.def("moralize", &pagoracle::Moralization::augment);

    // ── Discovery queries ──
    m.def("discriminating_path", &pagoracle::DiscriminatingPathSearch::find,
          py::arg("graph"), py::arg("a"), py::arg("b"), py::arg("c"),
          py::arg("max_path_length") = -1);

    m.def("pds", &pagoracle::Pds::compute,
          py::arg("graph"), py::arg("x"), py::arg("y"), py::arg("max_path_length") = -1);

    m.def("pds_path", &pagoracle::Pds::computeRestricted,
          py::arg("graph"), py::arg("x"), py::arg("y"), py::arg("pds_set"),
          py::arg("max_path_length") = -1);

    m.def("uncovered_pd_path", &pagoracle::UncoveredPathSearch::possiblyDirected,
          py::arg("graph"), py::arg("u"), py::arg("c"),
          py::arg("excluded") = pagoracle::NodeSet{}, py::arg("max_path_length") = -1);
}
