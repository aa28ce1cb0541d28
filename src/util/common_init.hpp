#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>
#include <thread>
#include <unordered_set>

// FASTASEEK_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace fastaseek {

// Flags shared by every tool; they never take a value.
inline const std::unordered_set<std::string>& common_flags() {
    static const std::unordered_set<std::string> flags = {
        "-v", "--verbose", "-q", "--quiet", "-h", "--help", "--version"};
    return flags;
}

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, FASTASEEK_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose and -q / --quiet flags, tagged
// with the program's base name.
inline Logger make_logger(const CliParser& cli, std::FILE* stream = stderr) {
    std::string prog = cli.program();
    size_t slash = prog.rfind('/');
    if (slash != std::string::npos) prog.erase(0, slash + 1);

    Logger::Level level = Logger::kInfo;
    if (cli.has("-q") || cli.has("--quiet")) {
        level = Logger::kError;
    } else if (cli.has("-v") || cli.has("--verbose")) {
        level = Logger::kDebug;
    }
    return Logger(level, stream, prog);
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

} // namespace fastaseek
