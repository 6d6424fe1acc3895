#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
// Rejects trailing garbage ("22x").
int safe_stoi(const std::string& s, int fallback = 0);

// ASCII lower-case copy.
std::string to_lower(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
