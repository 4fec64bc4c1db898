#pragma once

#include "caproute/config.h"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace caproute {

// CAPROUTE_ROOT when set, else the nearest ancestor of the executable (or the
// working directory) holding a "catalog" directory, else the working directory.
std::filesystem::path resolve_root(const char* argv0);
void set_env_if_missing(const char* key, const std::string& value);

struct CliArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> values;   // --flag VALUE
    std::set<std::string> switches;              // --flag
};

// Parses argv[first..]. Flags listed in value_flags consume the next token.
CliArgs parse_cli_args(int argc, char** argv, int first, const std::set<std::string>& value_flags);

// Profile defaults, environment, then --catalog/--data/--host/--port overrides.
// Relative catalog and data directories are anchored at root.
ServiceConfig configure_from_args(const std::filesystem::path& root, const CliArgs& args);

// Reads a whole file ("-" reads stdin), capped at max_bytes.
// Returns "" on success, else the reason.
std::string read_input(const std::string& path, std::string* out, size_t max_bytes = 10 * 1024 * 1024);

} // namespace caproute
