#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int value = std::stoi(s, &used);
        if (used != s.size()) return fallback;
        return value;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
