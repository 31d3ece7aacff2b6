#pragma once

#include "effect.hpp"

// Runs a user command at a lifecycle phase. With args set the program is
// executed directly; otherwise the command line goes through the shell.
// The child gets its own process group so a timeout kills everything it
// started.
class HookEffect : public Effect {
public:
    HookEffect(HookDefinition def, const RuntimeOptions& options);

    bool can_apply(const WorktreeContext& ctx) const override;
    Result<EffectResult> apply(const WorktreeContext& ctx) override;
    std::string effect_type() const override { return "hook"; }
    bool continue_on_error() const override { return def_.continue_on_error; }
    std::string describe(const WorktreeContext& ctx) const override;
    std::string skip_reason(const WorktreeContext& ctx) const override;
    std::string target(const WorktreeContext& ctx) const override { return describe(ctx); }

    // Effective limit: 0 in the definition means the default.
    uint64_t timeout_seconds() const;

private:
    HookDefinition def_;
    RuntimeOptions options_;
};
