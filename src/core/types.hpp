#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <variant>
#include <functional>
#include <cstdint>
#include "errors.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Generic};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Generic};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Effect definitions ──────────────────────────────────────

enum class MappingType {
    Symlink,
    Copy,
};

enum class LifecyclePhase {
    PreAdd,
    PostAdd,
    PreRemove,
    PostRemove,
};

// Chain-level policy for effects that fail with continue_on_error=false.
enum class ErrorHandling {
    Abort,
    Continue,
};

// How links are materialized. Auto picks the platform's native strategy.
enum class LinkMode {
    Auto,
    Copy,
};

struct SymlinkDefinition {
    std::string source;                          // relative to repo root unless absolute
    std::string target;                          // always relative to worktree root
    MappingType mapping_type = MappingType::Symlink;
    bool skip_if_exists = false;
    std::string description;
};

struct HookDefinition {
    std::string command;
    std::optional<std::vector<std::string>> args;  // set => exec directly, no shell
    bool continue_on_error = false;
    uint64_t timeout_seconds = 60;
    std::map<std::string, std::string> env;
};

using EffectDefinition = std::variant<SymlinkDefinition, HookDefinition>;

// Ordered definitions grouped by phase, as produced by the config loader.
struct EffectPlan {
    std::map<LifecyclePhase, std::vector<EffectDefinition>> phases;
    ErrorHandling error_handling = ErrorHandling::Abort;

    const std::vector<EffectDefinition>& effects_for(LifecyclePhase phase) const {
        static const std::vector<EffectDefinition> empty;
        auto it = phases.find(phase);
        return it == phases.end() ? empty : it->second;
    }
};

// ── Worktree metadata ───────────────────────────────────────

struct WorktreeInfo {
    std::string path;
    std::string branch;          // short name ("feature-x"), empty when detached
    std::string commit;
    bool bare = false;
    bool detached = false;
    bool locked = false;
    bool prunable = false;
};

// Captured output of a child process
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    bool spawn_failed = false;   // exec/fork failed; stderr_data holds the reason

    bool success() const { return !timed_out && !spawn_failed && exit_code == 0; }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Injected runtime toggles (never read from the environment).
struct RuntimeOptions {
    bool dry_run = false;
    bool verbose = false;
    std::string log_path;        // empty => default debug log under temp dir
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

const char* phase_name(LifecyclePhase phase);
const char* mapping_type_name(MappingType type);
const char* error_handling_name(ErrorHandling handling);
