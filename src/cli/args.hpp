#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>

// Command arguments split into positionals, boolean flags and valued options.
struct ParsedArgs {
    std::vector<std::string> positional;
    std::set<std::string> flags;
    std::map<std::string, std::string> options;
    std::string error;                  // non-empty on a usage error

    bool has(const std::string& flag) const { return flags.count(flag) > 0; }

    std::string get(const std::string& option, const std::string& fallback = "") const {
        auto it = options.find(option);
        return it == options.end() ? fallback : it->second;
    }

    std::string arg(size_t index) const {
        return index < positional.size() ? positional[index] : "";
    }
};

struct ArgSpec {
    std::set<std::string> flags;                    // "--force"
    std::set<std::string> options;                  // "--format" (takes a value)
    std::map<std::string, std::string> short_names; // "-f" -> "--force"
};

// Accepts "--opt value" and "--opt=value"; "--" ends option parsing.
ParsedArgs parse_args(const std::vector<std::string>& args, const ArgSpec& spec);
