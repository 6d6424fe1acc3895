#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the system temporary directory ($TMPDIR, else /tmp).
std::filesystem::path temp_dir();

// Value of an environment variable, or nullopt when unset.
std::optional<std::string> get_env(const std::string& name);

// Split a PATH-style value on ':'. Empty entries are dropped; order is
// preserved.
std::vector<std::string> search_path_entries(const std::string& value);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
