#include "graph_ops.hpp"

#include <queue>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace bfsgraph {
namespace graph_ops {

VertexNotFound::VertexNotFound(const Vertex& vertex)
    : std::invalid_argument("Start node '" + vertex + "' not found in graph"),
      vertex_(vertex) {}

std::vector<Vertex> breadth_first_search(
    const AdjacencyList& graph,
    const Vertex& start
) {
    if (!graph.contains(start)) {
        throw VertexNotFound(start);
    }

    std::unordered_set<Vertex> visited;
    std::vector<Vertex> order;
    std::queue<Vertex> frontier;

    visited.insert(start);
    frontier.push(start);

    while (!frontier.empty()) {
        Vertex current = std::move(frontier.front());
        frontier.pop();

        // Undeclared vertices come back with no neighbors
        for (const Vertex& neighbor : graph.neighbors(current)) {
            if (visited.insert(neighbor).second) {
                frontier.push(neighbor);
            }
        }

        order.push_back(std::move(current));
    }

    spdlog::debug("bfs from '{}' visited {} of {} vertices", start, order.size(), graph.num_vertices());
    return order;
}

std::optional<std::vector<Vertex>> bfs_shortest_path(
    const AdjacencyList& graph,
    const Vertex& start,
    const Vertex& target
) {
    if (!graph.contains(start) || !graph.contains(target)) {
        return std::nullopt;
    }

    if (start == target) {
        return std::vector<Vertex>{start};
    }

    // Each entry carries the path that reached it, itself included
    std::queue<std::pair<Vertex, std::vector<Vertex>>> frontier;
    std::unordered_set<Vertex> visited;

    frontier.push({start, {start}});
    visited.insert(start);

    while (!frontier.empty()) {
        auto [current, path] = std::move(frontier.front());
        frontier.pop();

        for (const Vertex& neighbor : graph.neighbors(current)) {
            if (neighbor == target) {
                path.push_back(neighbor);
                spdlog::debug("shortest path '{}' -> '{}' has {} edges", start, target, path.size() - 1);
                return path;
            }

            if (visited.insert(neighbor).second) {
                std::vector<Vertex> extended = path;
                extended.push_back(neighbor);
                frontier.push({neighbor, std::move(extended)});
            }
        }
    }

    spdlog::debug("no path from '{}' to '{}'", start, target);
    return std::nullopt;
}

std::vector<std::vector<Vertex>> bfs_connected_components(
    const AdjacencyList& graph
) {
    std::unordered_set<Vertex> visited;
    std::vector<std::vector<Vertex>> components;

    for (const Vertex& root : graph.vertices()) {
        if (visited.count(root) != 0) {
            continue;
        }

        // BFS from this vertex
        std::vector<Vertex> component;
        std::queue<Vertex> q;
        q.push(root);
        visited.insert(root);

        while (!q.empty()) {
            Vertex current = std::move(q.front());
            q.pop();

            for (const Vertex& neighbor : graph.neighbors(current)) {
                if (visited.insert(neighbor).second) {
                    q.push(neighbor);
                }
            }

            component.push_back(std::move(current));
        }

        components.push_back(std::move(component));
    }

    spdlog::debug("found {} components over {} vertices", components.size(), graph.num_vertices());
    return components;
}

std::vector<Vertex> bfs_neighbors(
    const AdjacencyList& graph,
    const std::vector<Vertex>& start_nodes,
    int max_depth
) {
    std::unordered_set<Vertex> visited;
    std::vector<Vertex> reached;
    std::queue<std::pair<Vertex, int>> frontier;

    // Initialize with start nodes at depth 0
    for (const Vertex& node : start_nodes) {
        if (visited.insert(node).second) {
            frontier.push({node, 0});
        }
    }

    while (!frontier.empty()) {
        auto [current, depth] = std::move(frontier.front());
        frontier.pop();

        if (depth < max_depth) {
            for (const Vertex& neighbor : graph.neighbors(current)) {
                if (visited.insert(neighbor).second) {
                    frontier.push({neighbor, depth + 1});
                }
            }
        }

        reached.push_back(std::move(current));
    }

    return reached;
}

}  // namespace graph_ops
}  // namespace bfsgraph
