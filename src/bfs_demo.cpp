#include <exception>
#include <string>
#include <vector>

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/env.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "adjacency_list.hpp"
#include "demo_config.hpp"
#include "graph_io.hpp"
#include "graph_ops.hpp"

namespace {

std::string join(const std::vector<bfsgraph::Vertex>& vertices) {
    return fmt::format("[{}]", fmt::join(vertices, ", "));
}

void run(const bfsgraph::demo::DemoConfig& config) {
    using namespace bfsgraph;

    AdjacencyList graph{
        {"A", {"B", "C"}},
        {"B", {"A", "D", "E"}},
        {"C", {"A", "F"}},
        {"D", {"B"}},
        {"E", {"B", "F"}},
        {"F", {"C", "E"}},
    };
    AdjacencyList disconnected{
        {"A", {"B", "C"}},
        {"B", {"A", "C"}},
        {"C", {"A", "B"}},
        {"D", {"E"}},
        {"E", {"D"}},
        {"F", {}},
    };
    if (!config.graph_path.empty()) {
        graph = graph_io::load_adjacency_file(config.graph_path);
        disconnected = graph;
    }
    spdlog::info("graph has {} vertices and {} edges", graph.num_vertices(), graph.num_edges());

    fmt::print("Testing BFS traversal:\n");
    auto order = graph_ops::breadth_first_search(graph, config.start);
    fmt::print("BFS traversal from '{}': {}\n\n", config.start, join(order));

    fmt::print("Testing shortest path finding:\n");
    auto path = graph_ops::bfs_shortest_path(graph, config.start, config.target);
    if (path) {
        fmt::print("Shortest path from '{}' to '{}': {}\n\n", config.start, config.target, join(*path));
    } else {
        fmt::print("No path from '{}' to '{}'\n\n", config.start, config.target);
    }

    fmt::print("Testing connected components:\n");
    auto components = graph_ops::bfs_connected_components(disconnected);
    std::vector<std::string> rendered;
    for (const auto& component : components) {
        rendered.push_back(join(component));
    }
    fmt::print("Connected components: [{}]\n", fmt::join(rendered, ", "));
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::cfg::load_env_levels();
    spdlog::cfg::load_argv_levels(argc, argv);

    try {
        run(bfsgraph::demo::parse_args(argc, argv));
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
