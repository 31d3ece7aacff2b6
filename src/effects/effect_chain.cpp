#include "effect_chain.hpp"
#include "symlink_effect.hpp"
#include "hook_effect.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <exception>

const char* effect_kind_name(EffectKind kind) {
    switch (kind) {
        case EffectKind::Success: return "ok";
        case EffectKind::Skipped: return "skipped";
        case EffectKind::Warning: return "warning";
        case EffectKind::Failure: return "failed";
    }
    return "unknown";
}

const char* phase_state_name(PhaseState state) {
    switch (state) {
        case PhaseState::Pending:   return "pending";
        case PhaseState::Running:   return "running";
        case PhaseState::Completed: return "completed";
        case PhaseState::Aborted:   return "aborted";
    }
    return "unknown";
}

EffectChain::EffectChain(ErrorHandling policy) : policy_(policy) {}

void EffectChain::add(LifecyclePhase phase, std::unique_ptr<Effect> effect) {
    effects_[phase].push_back(std::move(effect));
}

size_t EffectChain::size(LifecyclePhase phase) const {
    auto it = effects_.find(phase);
    return it == effects_.end() ? 0 : it->second.size();
}

static void log_effect(LifecyclePhase phase, const EffectResult& r) {
    twin_log(fmt::format("effect phase={} type={} kind={} target={} duration_ms={} msg={}",
                         phase_name(phase), r.effect_type, effect_kind_name(r.kind),
                         r.target, r.duration.count(), single_line(r.message)));
}

// Runs apply() and stamps type, target and duration on the result.
// Exceptions from the filesystem layer count as an Io failure.
EffectResult EffectChain::run_one(Effect& effect, const WorktreeContext& ctx,
                                  Result<EffectResult>& outcome) {
    auto start = std::chrono::steady_clock::now();
    try {
        outcome = effect.apply(ctx);
    } catch (const std::exception& e) {
        outcome = Result<EffectResult>::Err(ErrorKind::Io, e.what());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EffectResult r = outcome.is_ok() ? outcome.value : EffectResult{};
    if (r.effect_type.empty()) r.effect_type = effect.effect_type();
    if (r.target.empty()) r.target = effect.target(ctx);
    r.duration = elapsed;
    return r;
}

PhaseReport EffectChain::execute(LifecyclePhase phase, const WorktreeContext& ctx) {
    PhaseReport report;
    report.phase = phase;
    report.state = PhaseState::Running;

    auto& applied = applied_[phase];
    applied.clear();

    auto it = effects_.find(phase);
    if (it == effects_.end()) {
        report.state = PhaseState::Completed;
        return report;
    }

    twin_log(fmt::format("phase {} start effects={} policy={}", phase_name(phase),
                         it->second.size(), error_handling_name(policy_)));

    for (auto& effect : it->second) {
        if (!effect->can_apply(ctx)) {
            auto r = EffectResult::skipped(effect->effect_type(), effect->target(ctx),
                                           effect->skip_reason(ctx));
            log_effect(phase, r);
            report.results.push_back(std::move(r));
            continue;
        }

        Result<EffectResult> outcome = Result<EffectResult>::Err("not run");
        EffectResult r = run_one(*effect, ctx, outcome);

        if (outcome.is_ok()) {
            if (r.kind == EffectKind::Success) applied.push_back(effect.get());
            log_effect(phase, r);
            report.results.push_back(std::move(r));
            continue;
        }

        r.success = false;
        r.message = outcome.error;

        if (effect->continue_on_error()) {
            r.kind = EffectKind::Warning;
            r.error_kind = outcome.kind == ErrorKind::Timeout ? ErrorKind::Timeout
                                                               : ErrorKind::EffectWarning;
            log_effect(phase, r);
            report.results.push_back(std::move(r));
            continue;
        }

        r.kind = EffectKind::Failure;
        r.error_kind = outcome.kind == ErrorKind::Timeout ? ErrorKind::Timeout
                                                           : ErrorKind::EffectCritical;
        log_effect(phase, r);

        if (policy_ == ErrorHandling::Abort) {
            report.abort_error = fmt::format("{} failed: {}", effect->describe(ctx), r.message);
            report.abort_kind = r.error_kind;
            report.results.push_back(std::move(r));
            report.state = PhaseState::Aborted;
            twin_log(fmt::format("phase {} aborted: {}", phase_name(phase), report.abort_error));
            return report;
        }
        report.results.push_back(std::move(r));
    }

    report.state = PhaseState::Completed;
    twin_log(fmt::format("phase {} completed", phase_name(phase)));
    return report;
}

std::vector<std::string> EffectChain::rollback(LifecyclePhase phase, const WorktreeContext& ctx) {
    std::vector<std::string> errors;
    auto& applied = applied_[phase];
    for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
        auto r = (*it)->rollback(ctx);
        if (r.is_err()) {
            twin_log(fmt::format("rollback phase={} error={}", phase_name(phase), r.error));
            errors.push_back(r.error);
        }
    }
    applied.clear();
    return errors;
}

EffectChain build_effect_chain(const EffectPlan& plan, platform::LinkStrategy& links,
                               const RuntimeOptions& options) {
    EffectChain chain(plan.error_handling);
    for (const auto& [phase, definitions] : plan.phases) {
        bool removing = phase == LifecyclePhase::PreRemove || phase == LifecyclePhase::PostRemove;
        for (const auto& def : definitions) {
            if (auto* mapping = std::get_if<SymlinkDefinition>(&def)) {
                if (removing)
                    chain.add(phase, std::make_unique<UnlinkEffect>(*mapping, links, options));
                else
                    chain.add(phase, std::make_unique<SymlinkEffect>(*mapping, links, options));
            } else {
                chain.add(phase, std::make_unique<HookEffect>(std::get<HookDefinition>(def), options));
            }
        }
    }
    return chain;
}
