#include "template.hpp"
#include <optional>

static std::optional<std::string> lookup_brace(const std::string& key, const WorktreeContext& ctx) {
    if (key == "branch") return ctx.branch_name();
    if (key == "worktree_path") return ctx.worktree_path().string();
    if (key == "source_path" || key == "repo_root") return ctx.source_path().string();
    if (key == "name") return ctx.name();
    return std::nullopt;
}

static std::optional<std::string> lookup_dollar(const std::string& key, const WorktreeContext& ctx) {
    if (key == "BRANCH") return ctx.branch_name();
    if (key == "WORKTREE_PATH") return ctx.worktree_path().string();
    if (key == "PROJECT_ROOT") return ctx.source_path().string();
    if (key == "AGENT_NAME") return ctx.name();
    return std::nullopt;
}

std::string substitute_placeholders(const std::string& tmpl, const WorktreeContext& ctx) {
    std::string out;
    out.reserve(tmpl.size());

    size_t i = 0;
    while (i < tmpl.size()) {
        bool dollar = tmpl[i] == '$' && i + 1 < tmpl.size() && tmpl[i + 1] == '{';
        size_t open = dollar ? i + 1 : i;
        if (tmpl[open] != '{') {
            out += tmpl[i++];
            continue;
        }

        size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(tmpl, i, std::string::npos);
            break;
        }

        std::string key = tmpl.substr(open + 1, close - open - 1);
        auto value = dollar ? lookup_dollar(key, ctx) : lookup_brace(key, ctx);
        if (value) {
            out += *value;
            i = close + 1;
        } else {
            // Unknown: emit the opening character(s) and keep scanning after them,
            // so a known placeholder nested later in the text still resolves.
            out.append(tmpl, i, open + 1 - i);
            i = open + 1;
        }
    }
    return out;
}

std::map<std::string, std::string> context_environment(const WorktreeContext& ctx) {
    return {
        {"TWIN_AGENT_NAME", ctx.name()},
        {"TWIN_BRANCH", ctx.branch_name()},
        {"TWIN_WORKTREE_PATH", ctx.worktree_path().string()},
        {"TWIN_PROJECT_ROOT", ctx.source_path().string()},
    };
}
