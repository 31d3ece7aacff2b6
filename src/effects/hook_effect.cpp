#include "hook_effect.hpp"
#include "template.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>

namespace fs = std::filesystem;

HookEffect::HookEffect(HookDefinition def, const RuntimeOptions& options)
    : def_(std::move(def)), options_(options) {}

uint64_t HookEffect::timeout_seconds() const {
    return def_.timeout_seconds == 0 ? DEFAULT_HOOK_TIMEOUT_SECS : def_.timeout_seconds;
}

bool HookEffect::can_apply(const WorktreeContext& ctx) const {
    (void)ctx;
    std::string cmd = def_.command;
    trim(cmd);
    return !cmd.empty();
}

std::string HookEffect::skip_reason(const WorktreeContext& ctx) const {
    (void)ctx;
    return "empty command";
}

std::string HookEffect::describe(const WorktreeContext& ctx) const {
    std::string line = substitute_placeholders(def_.command, ctx);
    if (def_.args) {
        for (const auto& a : *def_.args) {
            std::string arg = substitute_placeholders(a, ctx);
            line += arg.find(' ') == std::string::npos ? " " + arg : " \"" + arg + "\"";
        }
    }
    return line;
}

// First non-empty line of child output, for the report message.
static std::string first_line(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        std::string line = text.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        trim(line);
        if (!line.empty()) return line;
        if (end == std::string::npos) break;
        pos = end + 1;
    }
    return "";
}

Result<EffectResult> HookEffect::apply(const WorktreeContext& ctx) {
    std::string display = describe(ctx);

    if (options_.dry_run) {
        return Result<EffectResult>::Ok(EffectResult::ok("hook", display,
            fmt::format("[dry run] would run: {}", display)));
    }

    platform::SpawnOptions spawn_opts;
    std::error_code ec;
    spawn_opts.cwd = fs::is_directory(ctx.worktree_path(), ec) ? ctx.worktree_path()
                                                               : ctx.source_path();
    spawn_opts.env = context_environment(ctx);
    for (const auto& [key, value] : def_.env) {
        spawn_opts.env[key] = substitute_placeholders(value, ctx);
    }
    spawn_opts.capture_output = true;
    spawn_opts.new_process_group = true;

    uint64_t secs = timeout_seconds();
    uint64_t max_secs = static_cast<uint64_t>(std::numeric_limits<int>::max() / 1000);
    int timeout_ms = static_cast<int>(std::min(secs, max_secs) * 1000);

    std::string command = substitute_placeholders(def_.command, ctx);
    ProcessResult r;
    if (def_.args) {
        std::vector<std::string> args;
        for (const auto& a : *def_.args) args.push_back(substitute_placeholders(a, ctx));
        r = platform::run_captured(command, args, spawn_opts, timeout_ms);
    } else {
        r = platform::run_shell(command, spawn_opts, timeout_ms);
    }
    twin_log_process("hook", display, r);

    if (r.spawn_failed) {
        return Result<EffectResult>::Err(ErrorKind::EffectCritical,
            fmt::format("failed to start: {}", single_line(r.stderr_data)));
    }
    if (r.timed_out) {
        return Result<EffectResult>::Err(ErrorKind::Timeout,
            fmt::format("timed out after {}s", secs));
    }
    if (r.exit_code != 0) {
        std::string detail = first_line(r.stderr_data);
        if (detail.empty()) detail = first_line(r.stdout_data);
        return Result<EffectResult>::Err(ErrorKind::EffectCritical,
            detail.empty() ? fmt::format("exited with code {}", r.exit_code)
                           : fmt::format("exited with code {}: {}", r.exit_code, detail));
    }

    std::string out = first_line(r.stdout_data);
    return Result<EffectResult>::Ok(EffectResult::ok("hook", display,
        out.empty() ? "exit 0" : fmt::format("exit 0: {}", out)));
}
