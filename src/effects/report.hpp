#pragma once

#include <string>
#include <vector>
#include "effect_chain.hpp"

// What happened to the git worktree primitive itself.
struct GitOutcome {
    bool attempted = false;
    bool success = false;
    std::string message;
};

// Aggregated result of one add/remove invocation: git outcome plus every
// phase report, bucketed for rendering and for the process exit code.
class OperationReport {
public:
    OperationReport() = default;
    OperationReport(std::string operation, std::string worktree_path, std::string branch);

    void set_git_outcome(GitOutcome outcome) { git_ = std::move(outcome); }
    void add_phase(PhaseReport phase) { phases_.push_back(std::move(phase)); }

    // Failure that stopped the command before or outside any phase
    // (lock, bad arguments, missing worktree).
    void set_error(ErrorKind kind, std::string message);
    void add_rollback_errors(const std::vector<std::string>& errors);
    void set_rolled_back(bool rolled_back) { rolled_back_ = rolled_back; }

    const std::string& operation() const { return operation_; }
    const std::string& worktree_path() const { return worktree_path_; }
    const std::string& branch() const { return branch_; }
    const GitOutcome& git() const { return git_; }
    const std::vector<PhaseReport>& phases() const { return phases_; }
    const std::string& error() const { return error_; }
    ErrorKind error_kind() const { return error_kind_; }
    const std::vector<std::string>& rollback_errors() const { return rollback_errors_; }
    bool rolled_back() const { return rolled_back_; }

    std::vector<const EffectResult*> results(EffectKind kind) const;
    size_t count(EffectKind kind) const;
    size_t fallback_count() const;

    // The phase that aborted, if any.
    const PhaseReport* aborted_phase() const;

    // Success means: no command-level error, git succeeded (when it ran)
    // and no phase aborted. Failures under the Continue policy and
    // warnings do not make the command fail.
    bool success() const;
    int exit_code() const { return success() ? 0 : 1; }

    // "3 ok, 1 skipped, 0 warnings, 0 failed"
    std::string summary() const;

    // Manual cleanup advice after an abort, empty when nothing is needed.
    std::string remediation() const;

private:
    std::string operation_;
    std::string worktree_path_;
    std::string branch_;
    GitOutcome git_;
    std::vector<PhaseReport> phases_;
    std::string error_;
    ErrorKind error_kind_ = ErrorKind::None;
    std::vector<std::string> rollback_errors_;
    bool rolled_back_ = false;
};
