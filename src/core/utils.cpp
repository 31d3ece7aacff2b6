#include "utils.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string truncate(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    if (max_len <= 3) return s.substr(0, max_len);
    return s.substr(0, max_len - 3) + "...";
}

std::string single_line(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = false;
    for (char c : s) {
        bool space = (c == '\n' || c == '\r' || c == '\t' || c == ' ');
        if (space) {
            if (!prev_space && !out.empty()) out += ' ';
        } else {
            out += c;
        }
        prev_space = space;
    }
    trim(out);
    return out;
}

std::string quote_path(const fs::path& p) {
    return "\"" + p.string() + "\"";
}

bool path_is_within(const fs::path& path, const fs::path& base) {
    auto p = path.lexically_normal();
    auto b = base.lexically_normal();
    auto rel = p.lexically_relative(b);
    if (rel.empty()) return false;
    auto first = *rel.begin();
    return first != "..";
}
