#include "graph_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

namespace bfsgraph {
namespace graph_io {

namespace {

inline bool is_blank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    size_t first = 0;
    size_t last = s.size();
    while (first < last && is_blank(s[first])) ++first;
    while (last > first && is_blank(s[last - 1])) --last;
    return s.substr(first, last - first);
}

// Split on any run of whitespace or commas
std::vector<Vertex> split_neighbors(const std::string& s) {
    std::vector<Vertex> out;
    std::string token;
    for (char c : s) {
        if (is_blank(c) || c == ',') {
            if (!token.empty()) {
                out.push_back(std::move(token));
                token.clear();
            }
        } else {
            token.push_back(c);
        }
    }
    if (!token.empty()) {
        out.push_back(std::move(token));
    }
    return out;
}

}  // anonymous namespace

bool is_valid_vertex_name(const Vertex& name) {
    if (name.empty()) {
        return false;
    }
    return std::none_of(name.begin(), name.end(), [](char c) {
        return is_blank(c) || c == ',' || c == '#' || c == ':';
    });
}

ParseError::ParseError(size_t line, const std::string& what)
    : std::runtime_error("line " + std::to_string(line) + ": " + what),
      line_(line) {}

AdjacencyList parse_adjacency(std::istream& in) {
    AdjacencyList graph;
    std::unordered_set<Vertex> declared;
    std::string raw;
    size_t line_no = 0;

    while (std::getline(in, raw)) {
        ++line_no;

        // Strip trailing comment
        std::string line = trim(raw.substr(0, raw.find('#')));
        if (line.empty()) {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw ParseError(line_no, "expected '<vertex>: <neighbors>'");
        }

        Vertex vertex = trim(line.substr(0, colon));
        if (vertex.empty()) {
            throw ParseError(line_no, "empty vertex name");
        }
        if (!is_valid_vertex_name(vertex)) {
            throw ParseError(line_no, "invalid vertex name '" + vertex + "'");
        }
        if (!declared.insert(vertex).second) {
            throw ParseError(line_no, "vertex '" + vertex + "' declared twice");
        }

        // Tokens never hold blanks, ',' or '#'; only a stray ':' can slip through
        Neighbors neighbors = split_neighbors(line.substr(colon + 1));
        for (const Vertex& neighbor : neighbors) {
            if (!is_valid_vertex_name(neighbor)) {
                throw ParseError(line_no, "invalid neighbor name '" + neighbor + "'");
            }
        }

        graph.set_neighbors(vertex, std::move(neighbors));
    }

    spdlog::debug("parsed {} vertices, {} edges from {} lines",
                  graph.num_vertices(), graph.num_edges(), line_no);
    return graph;
}

AdjacencyList load_adjacency_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("Error opening file: " + path);
    }
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Error opening file: " + path);
    }
    spdlog::debug("loading adjacency from {}", path);
    return parse_adjacency(in);
}

void format_adjacency(const AdjacencyList& graph, std::ostream& out) {
    // Check everything first so nothing partial is written
    for (const Vertex& vertex : graph.vertices()) {
        if (!is_valid_vertex_name(vertex)) {
            throw std::invalid_argument("cannot write vertex name '" + vertex + "'");
        }
        for (const Vertex& neighbor : graph.neighbors(vertex)) {
            if (!is_valid_vertex_name(neighbor)) {
                throw std::invalid_argument("cannot write neighbor name '" + neighbor + "'");
            }
        }
    }

    for (const Vertex& vertex : graph.vertices()) {
        out << vertex << ':';
        for (const Vertex& neighbor : graph.neighbors(vertex)) {
            out << ' ' << neighbor;
        }
        out << '\n';
    }
}

}  // namespace graph_io
}  // namespace bfsgraph
