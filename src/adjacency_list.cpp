#include "adjacency_list.hpp"

namespace bfsgraph {

namespace {

const Neighbors kNoNeighbors;

}  // anonymous namespace

AdjacencyList::AdjacencyList(std::initializer_list<std::pair<Vertex, Neighbors>> entries) {
    for (const auto& entry : entries) {
        set_neighbors(entry.first, entry.second);
    }
}

void AdjacencyList::set_neighbors(const Vertex& vertex, Neighbors neighbors) {
    auto [it, inserted] = adjacency_.insert_or_assign(vertex, std::move(neighbors));
    if (inserted) {
        order_.push_back(it->first);
    }
}

void AdjacencyList::add_edge(const Vertex& from, const Vertex& to) {
    auto [it, inserted] = adjacency_.try_emplace(from);
    if (inserted) {
        order_.push_back(from);
    }
    it->second.push_back(to);
}

bool AdjacencyList::contains(const Vertex& vertex) const {
    return adjacency_.find(vertex) != adjacency_.end();
}

const Neighbors& AdjacencyList::neighbors(const Vertex& vertex) const {
    auto it = adjacency_.find(vertex);
    if (it == adjacency_.end()) {
        return kNoNeighbors;
    }
    return it->second;
}

size_t AdjacencyList::num_edges() const {
    size_t total = 0;
    for (const auto& entry : adjacency_) {
        total += entry.second.size();
    }
    return total;
}

}  // namespace bfsgraph
