#pragma once

#include <map>
#include <memory>
#include <vector>
#include <platform/link_strategy.hpp>
#include "effect.hpp"

enum class PhaseState {
    Pending,
    Running,
    Completed,
    Aborted,
};

const char* phase_state_name(PhaseState state);

struct PhaseReport {
    LifecyclePhase phase = LifecyclePhase::PreAdd;
    PhaseState state = PhaseState::Pending;
    std::vector<EffectResult> results;     // in execution order
    std::string abort_error;               // set when state == Aborted
    ErrorKind abort_kind = ErrorKind::None;

    bool aborted() const { return state == PhaseState::Aborted; }
};

// Ordered effects per lifecycle phase, executed under one error policy.
//
// Within a phase effects run strictly in insertion order. A failing effect
// with continue_on_error() becomes a Warning. Otherwise the policy decides:
// Abort stops the phase, Continue records a Failure and moves on.
class EffectChain {
public:
    explicit EffectChain(ErrorHandling policy = ErrorHandling::Abort);

    EffectChain(EffectChain&&) = default;
    EffectChain& operator=(EffectChain&&) = default;

    void add(LifecyclePhase phase, std::unique_ptr<Effect> effect);

    size_t size(LifecyclePhase phase) const;
    ErrorHandling policy() const { return policy_; }

    PhaseReport execute(LifecyclePhase phase, const WorktreeContext& ctx);

    // Roll back effects that completed in the last execute() of phase,
    // newest first. Returns the errors of rollbacks that failed.
    std::vector<std::string> rollback(LifecyclePhase phase, const WorktreeContext& ctx);

private:
    ErrorHandling policy_;
    std::map<LifecyclePhase, std::vector<std::unique_ptr<Effect>>> effects_;
    std::map<LifecyclePhase, std::vector<Effect*>> applied_;

    EffectResult run_one(Effect& effect, const WorktreeContext& ctx,
                         Result<EffectResult>& outcome);
};

// Build the chain for a plan. File mappings become SymlinkEffects in the
// add phases and UnlinkEffects in the remove phases.
EffectChain build_effect_chain(const EffectPlan& plan, platform::LinkStrategy& links,
                               const RuntimeOptions& options);
