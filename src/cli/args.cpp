#include "args.hpp"
#include <fmt/format.h>

ParsedArgs parse_args(const std::vector<std::string>& args, const ArgSpec& spec) {
    ParsedArgs parsed;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        std::string a = args[i];
        if (options_done || a.size() < 2 || a[0] != '-') {
            parsed.positional.push_back(a);
            continue;
        }
        if (a == "--") {
            options_done = true;
            continue;
        }

        std::string value;
        bool inline_value = false;
        auto eq = a.find('=');
        if (a.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            value = a.substr(eq + 1);
            a = a.substr(0, eq);
            inline_value = true;
        }

        auto alias = spec.short_names.find(a);
        if (alias != spec.short_names.end()) a = alias->second;

        if (spec.flags.count(a)) {
            if (inline_value) {
                parsed.error = fmt::format("{} does not take a value", a);
                return parsed;
            }
            parsed.flags.insert(a);
        } else if (spec.options.count(a)) {
            if (!inline_value) {
                if (i + 1 >= args.size()) {
                    parsed.error = fmt::format("{} needs a value", a);
                    return parsed;
                }
                value = args[++i];
            }
            parsed.options[a] = value;
        } else {
            parsed.error = fmt::format("unknown option {}", a);
            return parsed;
        }
    }
    return parsed;
}
