#pragma once

#include <string>
#include <chrono>
#include <core/types.hpp>
#include "context.hpp"

enum class EffectKind {
    Success,
    Skipped,
    Warning,    // failed, but continue_on_error let the phase carry on
    Failure,
};

const char* effect_kind_name(EffectKind kind);

// Outcome of one effect, as recorded in the phase report.
struct EffectResult {
    bool success = false;
    EffectKind kind = EffectKind::Failure;
    std::string message;
    std::string effect_type;
    std::string target;
    std::chrono::milliseconds duration{0};
    ErrorKind error_kind = ErrorKind::None;   // EffectRecoverable marks a fallback success

    static EffectResult ok(std::string type, std::string target, std::string message) {
        EffectResult r;
        r.success = true;
        r.kind = EffectKind::Success;
        r.effect_type = std::move(type);
        r.target = std::move(target);
        r.message = std::move(message);
        return r;
    }

    static EffectResult skipped(std::string type, std::string target, std::string reason) {
        EffectResult r = ok(std::move(type), std::move(target), std::move(reason));
        r.kind = EffectKind::Skipped;
        return r;
    }
};

// One atomic unit of side-effect work tied to a lifecycle phase.
//
// apply() returns Ok with a Success or Skipped result, or Err carrying the
// ErrorKind of the failure. The chain turns an Err into a Warning or
// Failure result depending on continue_on_error() and its policy.
class Effect {
public:
    virtual ~Effect() = default;

    // Cheap precondition check. False makes the chain record Skipped
    // with skip_reason() and never call apply().
    virtual bool can_apply(const WorktreeContext& ctx) const = 0;

    virtual Result<EffectResult> apply(const WorktreeContext& ctx) = 0;

    // Undo what apply() did. Default: nothing to undo.
    virtual Result<void> rollback(const WorktreeContext& ctx) {
        (void)ctx;
        return Result<void>::Ok();
    }

    virtual std::string effect_type() const = 0;

    virtual bool continue_on_error() const { return false; }

    // Human readable one-liner used in logs and dry-run output.
    virtual std::string describe(const WorktreeContext& ctx) const = 0;

    virtual std::string skip_reason(const WorktreeContext& ctx) const {
        (void)ctx;
        return "precondition not met";
    }

    // Identifier shown in report tables (target path or command).
    virtual std::string target(const WorktreeContext& ctx) const = 0;
};
