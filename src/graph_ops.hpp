#pragma once

#include <optional>
#include <stdexcept>
#include <vector>

#include "adjacency_list.hpp"

namespace bfsgraph {
namespace graph_ops {

/**
 * Raised by breadth_first_search when the start vertex is not a key of
 * the graph.
 */
class VertexNotFound : public std::invalid_argument {
public:
    explicit VertexNotFound(const Vertex& vertex);

    const Vertex& vertex() const { return vertex_; }

private:
    Vertex vertex_;
};

/**
 * Breadth-first traversal from a single start vertex.
 *
 * Args:
 *     graph: Adjacency list (vertex -> ordered neighbors)
 *     start: Vertex to start from, must be declared in graph
 *
 * Returns:
 *     Every vertex reachable from start, once each, in visitation order
 *
 * Throws:
 *     VertexNotFound if start is not declared in graph
 */
std::vector<Vertex> breadth_first_search(
    const AdjacencyList& graph,
    const Vertex& start
);

/**
 * Fewest-edges path between two vertices.
 *
 * Ties between equal-length paths go to the route discovered first in
 * adjacency order.
 *
 * Args:
 *     graph: Adjacency list
 *     start: Path source
 *     target: Path destination
 *
 * Returns:
 *     Vertices from start to target inclusive, or std::nullopt if either
 *     vertex is not declared or target is unreachable
 */
std::optional<std::vector<Vertex>> bfs_shortest_path(
    const AdjacencyList& graph,
    const Vertex& start,
    const Vertex& target
);

/**
 * Partition the graph into connected components.
 *
 * Only declared vertices seed a component. Undeclared neighbors show up in
 * the component that reaches them and nowhere else.
 *
 * Args:
 *     graph: Adjacency list
 *
 * Returns:
 *     Components ordered by their root's declaration order, members in BFS
 *     order from that root
 */
std::vector<std::vector<Vertex>> bfs_connected_components(
    const AdjacencyList& graph
);

/**
 * BFS for finding neighbors within a given depth.
 *
 * Args:
 *     graph: Adjacency list
 *     start_nodes: Starting vertices, emitted at depth 0
 *     max_depth: Maximum BFS depth
 *
 * Returns:
 *     All vertices reachable within max_depth, in visitation order
 */
std::vector<Vertex> bfs_neighbors(
    const AdjacencyList& graph,
    const std::vector<Vertex>& start_nodes,
    int max_depth
);

}  // namespace graph_ops
}  // namespace bfsgraph
