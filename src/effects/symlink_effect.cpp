#include "symlink_effect.hpp"
#include "template.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <set>

namespace fs = std::filesystem;

fs::path resolve_mapping_source(const SymlinkDefinition& def, const WorktreeContext& ctx) {
    fs::path source = substitute_placeholders(def.source, ctx);
    if (source.is_relative()) source = ctx.source_path() / source;
    return source.lexically_normal();
}

fs::path resolve_mapping_target(const SymlinkDefinition& def, const WorktreeContext& ctx) {
    std::string target = def.target.empty() ? def.source : def.target;
    return (ctx.worktree_path() / substitute_placeholders(target, ctx)).lexically_normal();
}

// Relative paths of everything under dir, taken before a copy merges into it.
static std::set<fs::path> existing_entries(const fs::path& dir, std::error_code& ec) {
    std::set<fs::path> entries;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        entries.insert(it->path().lexically_relative(dir));
    }
    return entries;
}

// Topmost entries under dir that were not in `before`. A new directory is
// listed once, its contents are not.
static std::vector<fs::path> added_entries(const fs::path& dir,
                                           const std::set<fs::path>& before) {
    std::vector<fs::path> added;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (before.count(it->path().lexically_relative(dir))) continue;
        added.push_back(it->path());
        it.disable_recursion_pending();
    }
    return added;
}

static bool source_exists(const fs::path& source) {
    std::error_code ec;
    return fs::exists(source, ec);
}

// ── SymlinkEffect ──────────────────────────────────────────

SymlinkEffect::SymlinkEffect(SymlinkDefinition def, platform::LinkStrategy& links,
                             const RuntimeOptions& options)
    : def_(std::move(def)), links_(links), options_(options) {}

bool SymlinkEffect::can_apply(const WorktreeContext& ctx) const {
    return source_exists(resolve_mapping_source(def_, ctx));
}

std::string SymlinkEffect::skip_reason(const WorktreeContext& ctx) const {
    return fmt::format("source missing: {}", resolve_mapping_source(def_, ctx).string());
}

std::string SymlinkEffect::effect_type() const {
    return def_.mapping_type == MappingType::Copy ? "copy" : "symlink";
}

std::string SymlinkEffect::target(const WorktreeContext& ctx) const {
    return resolve_mapping_target(def_, ctx).string();
}

std::string SymlinkEffect::describe(const WorktreeContext& ctx) const {
    return fmt::format("{} {} -> {}", effect_type(),
                       resolve_mapping_source(def_, ctx).string(),
                       resolve_mapping_target(def_, ctx).string());
}

Result<EffectResult> SymlinkEffect::apply(const WorktreeContext& ctx) {
    fs::path source = resolve_mapping_source(def_, ctx);
    fs::path target = resolve_mapping_target(def_, ctx);
    std::string target_str = target.string();

    if (!path_is_within(target, ctx.worktree_path())) {
        return Result<EffectResult>::Err(ErrorKind::InvalidArgument,
            fmt::format("target escapes the worktree: {}", target_str));
    }

    std::error_code ec;
    auto st = fs::symlink_status(target, ec);
    bool present = !ec && st.type() != fs::file_type::not_found;

    if (present && def_.skip_if_exists) {
        return Result<EffectResult>::Ok(
            EffectResult::skipped(effect_type(), target_str, "target exists"));
    }

    if (options_.dry_run) {
        return Result<EffectResult>::Ok(EffectResult::ok(effect_type(), target_str,
            fmt::format("[dry run] would {} {}", effect_type(), source.string())));
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return Result<EffectResult>::Err(ErrorKind::Io,
            fmt::format("cannot create {}: {}", target.parent_path().string(), ec.message()));
    }

    if (present) {
        // A checked-out file or stale link gives way; a real directory only
        // merges with a copy, it is never deleted to make room for a link.
        bool real_dir = st.type() == fs::file_type::directory;
        if (real_dir && def_.mapping_type == MappingType::Symlink) {
            return Result<EffectResult>::Err(ErrorKind::AlreadyExists,
                fmt::format("directory already exists at {}", target_str));
        }
        if (!real_dir) {
            ec = platform::remove_entry(target);
            if (ec) {
                return Result<EffectResult>::Err(ErrorKind::Io,
                    fmt::format("cannot replace {}: {}", target_str, ec.message()));
            }
        }
    }

    if (def_.mapping_type == MappingType::Copy) {
        bool merge = present && st.type() == fs::file_type::directory;
        std::set<fs::path> before;
        if (merge) {
            before = existing_entries(target, ec);
            if (ec) {
                return Result<EffectResult>::Err(ErrorKind::Io,
                    fmt::format("cannot read {}: {}", target_str, ec.message()));
            }
        }
        ec = platform::copy_path(source, target);
        if (ec) {
            return Result<EffectResult>::Err(ErrorKind::Io,
                fmt::format("copy failed: {}", ec.message()));
        }
        if (merge) {
            created_ = added_entries(target, before);
            return Result<EffectResult>::Ok(EffectResult::ok("copy", target_str,
                fmt::format("merged into existing directory ({} new)", created_.size())));
        }
        created_ = {target};
        return Result<EffectResult>::Ok(EffectResult::ok("copy", target_str, "copied"));
    }

    if (!links_.supports_native_symlink()) {
        return copy_fallback(source, target,
                             std::make_error_code(std::errc::operation_not_supported));
    }

    ec = links_.create_link(source, target);
    if (!ec) {
        created_ = {target};
        return Result<EffectResult>::Ok(EffectResult::ok("symlink", target_str, "linked"));
    }
    if (platform::is_fallback_error(ec)) {
        return copy_fallback(source, target, ec);
    }
    return Result<EffectResult>::Err(ErrorKind::Io,
        fmt::format("link failed: {}", ec.message()));
}

Result<EffectResult> SymlinkEffect::copy_fallback(const fs::path& source,
                                                  const fs::path& target,
                                                  const std::error_code& cause) {
    twin_log(fmt::format("symlink fallback target={} cause={} manual: {}",
                         target.string(), cause.message(),
                         links_.manual_instructions(source, target)));

    auto ec = platform::copy_path(source, target);
    if (ec) {
        return Result<EffectResult>::Err(ErrorKind::Io,
            fmt::format("link failed ({}) and copy fallback failed: {}",
                        cause.message(), ec.message()));
    }
    created_ = {target};

    auto result = EffectResult::ok("symlink", target.string(),
        fmt::format("fallback: copy used ({})", cause.message()));
    result.error_kind = ErrorKind::EffectRecoverable;
    return Result<EffectResult>::Ok(std::move(result));
}

Result<void> SymlinkEffect::rollback(const WorktreeContext& ctx) {
    (void)ctx;
    std::string failures;
    for (auto it = created_.rbegin(); it != created_.rend(); ++it) {
        auto ec = platform::remove_entry(*it);
        if (ec) {
            if (!failures.empty()) failures += ", ";
            failures += fmt::format("{}: {}", it->string(), ec.message());
            continue;
        }
        twin_log(fmt::format("rolled back {}", it->string()));
    }
    created_.clear();
    if (!failures.empty()) {
        return Result<void>::Err(ErrorKind::Io, "rollback failed for " + failures);
    }
    return Result<void>::Ok();
}

// ── UnlinkEffect ───────────────────────────────────────────

UnlinkEffect::UnlinkEffect(SymlinkDefinition def, platform::LinkStrategy& links,
                           const RuntimeOptions& options)
    : def_(std::move(def)), links_(links), options_(options) {}

std::string UnlinkEffect::target(const WorktreeContext& ctx) const {
    return resolve_mapping_target(def_, ctx).string();
}

std::string UnlinkEffect::describe(const WorktreeContext& ctx) const {
    return fmt::format("unlink {}", target(ctx));
}

bool UnlinkEffect::can_apply(const WorktreeContext& ctx) const {
    if (def_.mapping_type == MappingType::Copy) return false;

    fs::path target = resolve_mapping_target(def_, ctx);
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(target, ec)) || ec) return false;

    fs::path points_to = fs::read_symlink(target, ec);
    if (ec) return false;
    if (points_to.is_relative()) points_to = target.parent_path() / points_to;
    return points_to.lexically_normal() == resolve_mapping_source(def_, ctx);
}

std::string UnlinkEffect::skip_reason(const WorktreeContext& ctx) const {
    if (def_.mapping_type == MappingType::Copy) return "copy-mode target preserved";

    fs::path target = resolve_mapping_target(def_, ctx);
    std::error_code ec;
    auto st = fs::symlink_status(target, ec);
    if (ec || st.type() == fs::file_type::not_found) return "target missing";
    if (!fs::is_symlink(st)) return "not a symlink, preserved";
    return "link points elsewhere, preserved";
}

Result<EffectResult> UnlinkEffect::apply(const WorktreeContext& ctx) {
    fs::path target = resolve_mapping_target(def_, ctx);

    if (options_.dry_run) {
        return Result<EffectResult>::Ok(EffectResult::ok("unlink", target.string(),
            "[dry run] would remove link"));
    }

    auto ec = links_.remove_link(target);
    if (ec) {
        return Result<EffectResult>::Err(ErrorKind::Io,
            fmt::format("cannot remove link {}: {}", target.string(), ec.message()));
    }
    return Result<EffectResult>::Ok(EffectResult::ok("unlink", target.string(), "removed"));
}
