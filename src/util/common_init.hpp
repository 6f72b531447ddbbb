#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <thread>

// GENOTRACK_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace genotrack {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, GENOTRACK_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose flags.
inline Logger make_logger(const CliParser& cli, const char* cmd_name) {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo, cmd_name);
}

// Resolve thread count from CLI (0 or negative -> hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads") {
    int n = cli.get_int(key, 0);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

// Report a fatal error the way every genotrack tool does and return the
// exit status to use.
inline int report_fatal(const char* cmd_name, const char* msg = "Unexpected error.") {
    std::fprintf(stderr, "%s: %s\n", cmd_name, msg);
    return 1;
}

} // namespace genotrack
