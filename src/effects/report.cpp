#include "report.hpp"
#include <fmt/format.h>

OperationReport::OperationReport(std::string operation, std::string worktree_path,
                                 std::string branch)
    : operation_(std::move(operation)),
      worktree_path_(std::move(worktree_path)),
      branch_(std::move(branch)) {}

void OperationReport::set_error(ErrorKind kind, std::string message) {
    error_kind_ = kind;
    error_ = std::move(message);
}

void OperationReport::add_rollback_errors(const std::vector<std::string>& errors) {
    rollback_errors_.insert(rollback_errors_.end(), errors.begin(), errors.end());
}

std::vector<const EffectResult*> OperationReport::results(EffectKind kind) const {
    std::vector<const EffectResult*> out;
    for (const auto& phase : phases_) {
        for (const auto& r : phase.results) {
            if (r.kind == kind) out.push_back(&r);
        }
    }
    return out;
}

size_t OperationReport::count(EffectKind kind) const {
    return results(kind).size();
}

size_t OperationReport::fallback_count() const {
    size_t n = 0;
    for (const auto* r : results(EffectKind::Success)) {
        if (r->error_kind == ErrorKind::EffectRecoverable) n++;
    }
    return n;
}

const PhaseReport* OperationReport::aborted_phase() const {
    for (const auto& phase : phases_) {
        if (phase.aborted()) return &phase;
    }
    return nullptr;
}

bool OperationReport::success() const {
    if (error_kind_ != ErrorKind::None) return false;
    if (git_.attempted && !git_.success) return false;
    return aborted_phase() == nullptr;
}

std::string OperationReport::summary() const {
    return fmt::format("{} ok, {} skipped, {} warnings, {} failed",
                       count(EffectKind::Success), count(EffectKind::Skipped),
                       count(EffectKind::Warning), count(EffectKind::Failure));
}

std::string OperationReport::remediation() const {
    const PhaseReport* aborted = aborted_phase();
    if (!aborted) return "";

    switch (aborted->phase) {
        case LifecyclePhase::PreAdd:
            return "No worktree was created. Fix the failing pre_add hook and rerun.";
        case LifecyclePhase::PostAdd:
            if (rolled_back_ && rollback_errors_.empty()) {
                return fmt::format("Setup effects were rolled back. The worktree at {} exists "
                                   "without them; remove it with `twin remove {}` or rerun the "
                                   "failed step by hand.", worktree_path_, worktree_path_);
            }
            return fmt::format("The worktree at {} exists but setup is incomplete. Finish the "
                               "remaining steps by hand or remove it with `twin remove {}`.",
                               worktree_path_, worktree_path_);
        case LifecyclePhase::PreRemove:
            return fmt::format("The worktree at {} was kept. Fix the failing pre_remove step, "
                               "or run `git worktree remove {}` directly.",
                               worktree_path_, worktree_path_);
        case LifecyclePhase::PostRemove:
            return "The worktree was removed but post_remove cleanup did not finish. "
                   "Run the remaining cleanup by hand.";
    }
    return "";
}
