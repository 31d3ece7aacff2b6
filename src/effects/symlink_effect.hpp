#pragma once

#include <filesystem>
#include <vector>
#include <platform/link_strategy.hpp>
#include "effect.hpp"

// Absolute source of a mapping: templated, then resolved against the repo root.
std::filesystem::path resolve_mapping_source(const SymlinkDefinition& def,
                                             const WorktreeContext& ctx);

// Absolute target of a mapping inside the worktree.
std::filesystem::path resolve_mapping_target(const SymlinkDefinition& def,
                                             const WorktreeContext& ctx);

// Materializes a file mapping in a new worktree: a native link when the
// strategy allows it, otherwise a recursive copy.
class SymlinkEffect : public Effect {
public:
    SymlinkEffect(SymlinkDefinition def, platform::LinkStrategy& links,
                  const RuntimeOptions& options);

    bool can_apply(const WorktreeContext& ctx) const override;
    Result<EffectResult> apply(const WorktreeContext& ctx) override;
    Result<void> rollback(const WorktreeContext& ctx) override;
    std::string effect_type() const override;
    std::string describe(const WorktreeContext& ctx) const override;
    std::string skip_reason(const WorktreeContext& ctx) const override;
    std::string target(const WorktreeContext& ctx) const override;

    const SymlinkDefinition& definition() const { return def_; }

private:
    SymlinkDefinition def_;
    platform::LinkStrategy& links_;
    RuntimeOptions options_;
    std::vector<std::filesystem::path> created_;  // what apply() put on disk, parents first

    Result<EffectResult> copy_fallback(const std::filesystem::path& source,
                                       const std::filesystem::path& target,
                                       const std::error_code& cause);
};

// Removal counterpart run before a worktree is deleted. Only links that
// still point at the mapped source are removed; copies and anything the
// user replaced are left alone.
class UnlinkEffect : public Effect {
public:
    UnlinkEffect(SymlinkDefinition def, platform::LinkStrategy& links,
                 const RuntimeOptions& options);

    bool can_apply(const WorktreeContext& ctx) const override;
    Result<EffectResult> apply(const WorktreeContext& ctx) override;
    std::string effect_type() const override { return "unlink"; }
    std::string describe(const WorktreeContext& ctx) const override;
    std::string skip_reason(const WorktreeContext& ctx) const override;
    std::string target(const WorktreeContext& ctx) const override;

private:
    SymlinkDefinition def_;
    platform::LinkStrategy& links_;
    RuntimeOptions options_;
};
