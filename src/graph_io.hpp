#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include "adjacency_list.hpp"

namespace bfsgraph {
namespace graph_io {

/**
 * Malformed adjacency text. Carries the 1-based line number.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(size_t line, const std::string& what);

    size_t line() const { return line_; }

private:
    size_t line_;
};

/**
 * Whether a name can appear in adjacency text: non-empty, with no
 * whitespace, ',', '#' or ':'.
 */
bool is_valid_vertex_name(const Vertex& name);

/**
 * Parse adjacency text, one declaration per line:
 *
 *     # comment
 *     A: B C
 *     B: A, D, E
 *     F:
 *
 * Neighbors are separated by whitespace and/or commas. Declaration order
 * is kept.
 *
 * Args:
 *     in: Input stream
 *
 * Returns:
 *     Parsed graph
 *
 * Throws:
 *     ParseError on a missing ':', a vertex or neighbor name rejected by
 *     is_valid_vertex_name, or a vertex declared twice
 */
AdjacencyList parse_adjacency(std::istream& in);

/**
 * Load an adjacency file. See parse_adjacency for the format.
 *
 * Throws:
 *     std::runtime_error if path is not a readable regular file,
 *     ParseError on bad content
 */
AdjacencyList load_adjacency_file(const std::string& path);

/**
 * Write a graph in the format parse_adjacency reads.
 *
 * Throws:
 *     std::invalid_argument if any vertex or neighbor name fails
 *     is_valid_vertex_name; nothing is written in that case
 */
void format_adjacency(const AdjacencyList& graph, std::ostream& out);

}  // namespace graph_io
}  // namespace bfsgraph
