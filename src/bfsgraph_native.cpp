#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "adjacency_list.hpp"
#include "graph_ops.hpp"

namespace py = pybind11;

namespace {

// Convert Python dict to AdjacencyList, keeping dict order
bfsgraph::AdjacencyList to_adjacency(py::dict adjacency) {
    bfsgraph::AdjacencyList graph;
    for (auto item : adjacency) {
        auto key = item.first.cast<std::string>();
        auto neighbors = item.second.cast<std::vector<std::string>>();
        graph.set_neighbors(key, std::move(neighbors));
    }
    return graph;
}

}  // anonymous namespace

PYBIND11_MODULE(bfsgraph_native, m) {
    m.doc() = "Breadth-first search over adjacency-list graphs";

    // ====================
    // Graph Operations
    // ====================
    py::module graph_m = m.def_submodule("graph_ops", "Graph traversal operations");

    py::register_exception<bfsgraph::graph_ops::VertexNotFound>(
        graph_m, "VertexNotFound", PyExc_ValueError);

    graph_m.def("breadth_first_search",
        [](py::dict adjacency, const std::string& start_node) {
            return bfsgraph::graph_ops::breadth_first_search(to_adjacency(adjacency), start_node);
        },
        "BFS traversal order from start_node",
        py::arg("graph"), py::arg("start_node"));

    graph_m.def("bfs_shortest_path",
        [](py::dict adjacency, const std::string& start, const std::string& target) {
            // nullopt becomes None
            return bfsgraph::graph_ops::bfs_shortest_path(to_adjacency(adjacency), start, target);
        },
        "Shortest path from start to target, or None",
        py::arg("graph"), py::arg("start"), py::arg("target"));

    graph_m.def("bfs_connected_components",
        [](py::dict adjacency) {
            return bfsgraph::graph_ops::bfs_connected_components(to_adjacency(adjacency));
        },
        "Connected components in key order",
        py::arg("graph"));

    graph_m.def("bfs_neighbors",
        [](py::dict adjacency, const std::vector<std::string>& start_nodes, int max_depth) {
            return bfsgraph::graph_ops::bfs_neighbors(to_adjacency(adjacency), start_nodes, max_depth);
        },
        "Find all neighbors within max_depth using BFS",
        py::arg("graph"), py::arg("start_nodes"), py::arg("max_depth"));

    m.attr("__version__") = "0.1.0";
}
