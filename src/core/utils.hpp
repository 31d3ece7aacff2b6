#pragma once

#include <string>
#include <filesystem>

// Lowercased copy (ASCII only).
std::string to_lower(std::string s);

// Cut to max_len characters, marking the cut with "...".
std::string truncate(const std::string& s, size_t max_len);

// Flatten to one line: newlines and tabs become spaces, runs collapse.
std::string single_line(const std::string& s);

// Path in double quotes, as printed by `twin add --cd-command`.
std::string quote_path(const std::filesystem::path& p);

// True if `path` is `base` or lies underneath it (lexically, after normalization).
bool path_is_within(const std::filesystem::path& path, const std::filesystem::path& base);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
