#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "adjacency_list.hpp"

using bfsgraph::AdjacencyList;
using bfsgraph::Neighbors;
using bfsgraph::Vertex;

TEST(AdjacencyListTest, EmptyByDefault) {
    AdjacencyList g;
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.num_vertices(), 0u);
    EXPECT_EQ(g.num_edges(), 0u);
    EXPECT_TRUE(g.vertices().empty());
}

TEST(AdjacencyListTest, KeepsDeclarationOrder) {
    AdjacencyList g{{"C", {"A"}}, {"A", {}}, {"B", {"C", "A"}}};
    EXPECT_EQ(g.vertices(), (std::vector<Vertex>{"C", "A", "B"}));
    EXPECT_EQ(g.num_vertices(), 3u);
    EXPECT_EQ(g.num_edges(), 3u);
}

TEST(AdjacencyListTest, NeighborsKeepListedOrder) {
    AdjacencyList g{{"A", {"D", "B", "C", "B"}}};
    EXPECT_EQ(g.neighbors("A"), (Neighbors{"D", "B", "C", "B"}));
}

TEST(AdjacencyListTest, UndeclaredVertexHasNoNeighbors) {
    AdjacencyList g{{"A", {"B"}}};
    EXPECT_FALSE(g.contains("B"));
    EXPECT_TRUE(g.neighbors("B").empty());
    EXPECT_TRUE(g.neighbors("nowhere").empty());
}

TEST(AdjacencyListTest, RedeclareReplacesInPlace) {
    AdjacencyList g{{"A", {"B"}}, {"B", {}}};
    g.set_neighbors("A", {"C"});
    EXPECT_EQ(g.vertices(), (std::vector<Vertex>{"A", "B"}));
    EXPECT_EQ(g.neighbors("A"), (Neighbors{"C"}));
}

TEST(AdjacencyListTest, DuplicateInitializerKeyLastWins) {
    AdjacencyList g{{"A", {"B"}}, {"B", {}}, {"A", {"C"}}};
    EXPECT_EQ(g.vertices(), (std::vector<Vertex>{"A", "B"}));
    EXPECT_EQ(g.neighbors("A"), (Neighbors{"C"}));
}

TEST(AdjacencyListTest, AddEdgeDeclaresSourceOnly) {
    AdjacencyList g;
    g.add_edge("A", "B");
    g.add_edge("A", "C");
    g.add_edge("C", "A");
    EXPECT_EQ(g.vertices(), (std::vector<Vertex>{"A", "C"}));
    EXPECT_FALSE(g.contains("B"));
    EXPECT_EQ(g.neighbors("A"), (Neighbors{"B", "C"}));
    EXPECT_EQ(g.num_edges(), 3u);
}
