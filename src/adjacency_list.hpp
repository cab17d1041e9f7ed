#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bfsgraph {

using Vertex = std::string;
using Neighbors = std::vector<Vertex>;

/**
 * Adjacency mapping from vertex label to an ordered neighbor list.
 *
 * Vertices are iterated in declaration order. Re-declaring a vertex
 * replaces its neighbors and keeps its first position. A vertex that
 * only appears as a neighbor is not declared and has no neighbors.
 */
class AdjacencyList {
public:
    AdjacencyList() = default;
    AdjacencyList(std::initializer_list<std::pair<Vertex, Neighbors>> entries);

    /**
     * Declare a vertex, or replace the neighbors of an existing one.
     */
    void set_neighbors(const Vertex& vertex, Neighbors neighbors);

    /**
     * Append a directed edge. Declares `from` if needed; `to` is left
     * undeclared.
     */
    void add_edge(const Vertex& from, const Vertex& to);

    bool contains(const Vertex& vertex) const;

    /**
     * Neighbors of a vertex in listed order. Empty for undeclared vertices.
     */
    const Neighbors& neighbors(const Vertex& vertex) const;

    // Declared vertices, in declaration order
    const std::vector<Vertex>& vertices() const { return order_; }

    size_t num_vertices() const { return order_.size(); }
    size_t num_edges() const;
    bool empty() const { return order_.empty(); }

private:
    std::vector<Vertex> order_;
    std::unordered_map<Vertex, Neighbors> adjacency_;
};

}  // namespace bfsgraph
