#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>
#include <thread>
#include <vector>

// FASTXIO_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace fastxio {

// Flags shared by all tools; pass to CliParser so they never take a value.
inline std::vector<std::string> common_flags() {
    return {"-v", "--verbose", "-h", "--help", "--version"};
}

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, FASTXIO_VERSION);
        return true;
    }
    return false;
}

// Logger from -v / --verbose, prefixed with the command name.
inline Logger make_logger(const CliParser& cli, const char* cmd_name) {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo, cmd_name);
}

// Thread count from -threads (0 or negative: hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads") {
    int n = cli.get_int(key, 0);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

} // namespace fastxio
