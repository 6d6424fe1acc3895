#include "platform.hpp"
#include <cstdlib>

#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path(".");
    return p;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::vector<std::string> search_path_entries(const std::string& value) {
    const char sep = ':';
    std::vector<std::string> entries;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(sep, start);
        if (end == std::string::npos) end = value.size();
        if (end > start) {
            entries.push_back(value.substr(start, end - start));
        }
        start = end + 1;
    }
    return entries;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
