#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Where config discovery looks. Captured once so resolution never reads the
// process environment behind the caller's back.
struct SearchEnvironment {
    fs::path cwd;
    std::optional<std::string> search_path;   // raw PATH value, nullopt if unset
};

// Snapshot of the real cwd and PATH.
SearchEnvironment current_search_environment();

// Locates and loads cec-ssh_config.json.
//
// With an explicit path the file must exist (no fallback search). Without one
// the cwd is tried first, then every PATH directory in order; the first
// existing file wins and every probed path is kept for the failure report.
class ConfigResolver {
public:
    explicit ConfigResolver(SearchEnvironment env);

    ConfigResolution resolve(const std::optional<fs::path>& explicit_path) const;

    // Walk the search order. Appends every probed path to `tried`.
    std::optional<fs::path> find_config(std::vector<fs::path>& tried) const;

    // Parse one config file. Keys are matched case-insensitively; host,
    // username and password are required, port defaults to 22.
    static Result<ConnectionConfig> load_file(const fs::path& path);

private:
    SearchEnvironment env_;
};

// True if `p` names an existing regular file. Filesystem errors count as "no".
bool config_file_exists(const fs::path& p);
