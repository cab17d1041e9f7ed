#include "demo_config.hpp"

#include <stdexcept>

namespace bfsgraph {
namespace demo {

DemoConfig parse_args(int argc, const char* const argv[]) {
    DemoConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        // Log levels, picked up by load_argv_levels
        if (arg.rfind("SPDLOG_LEVEL=", 0) == 0) {
            continue;
        }
        if (arg != "--graph" && arg != "--start" && arg != "--target") {
            throw std::invalid_argument("unknown argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(arg + " needs a value");
        }
        std::string value = argv[++i];
        if (arg == "--graph") {
            config.graph_path = value;
        } else if (arg == "--start") {
            config.start = value;
        } else {
            config.target = value;
        }
    }
    return config;
}

}  // namespace demo
}  // namespace bfsgraph
