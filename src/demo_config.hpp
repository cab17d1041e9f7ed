#pragma once

#include <string>

namespace bfsgraph {
namespace demo {

/**
 * Command line settings for bfs_demo.
 */
struct DemoConfig {
    std::string graph_path;     // empty = built-in sample graph
    std::string start = "A";
    std::string target = "F";
};

/**
 * Fill a DemoConfig from command line flags.
 *
 * Accepts --graph FILE, --start V and --target V. SPDLOG_LEVEL=... arguments
 * are skipped; spdlog::cfg::load_argv_levels reads those.
 *
 * Args:
 *     argc: Argument count, argv[0] is the program name
 *     argv: Arguments
 *
 * Returns:
 *     Defaults overridden by the given flags
 *
 * Throws:
 *     std::invalid_argument on an unknown argument or a flag without a value
 */
DemoConfig parse_args(int argc, const char* const argv[]);

}  // namespace demo
}  // namespace bfsgraph
