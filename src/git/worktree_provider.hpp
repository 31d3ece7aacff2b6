#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

struct AddWorktreeOptions {
    bool create_branch = false;     // -b <branch>
    std::string start_point;        // base for a new branch, empty = HEAD
    bool force = false;
};

struct RemoveWorktreeOptions {
    bool force = false;
};

// The worktree primitive. The service only talks to this interface, so
// tests can substitute an in-memory implementation.
class WorktreeProvider {
public:
    virtual ~WorktreeProvider() = default;

    virtual Result<WorktreeInfo> add(const std::filesystem::path& path,
                                     const std::string& branch,
                                     const AddWorktreeOptions& options) = 0;

    virtual Result<void> remove(const std::filesystem::path& path,
                                const RemoveWorktreeOptions& options) = 0;

    // Main worktree first, then linked worktrees in git's order.
    virtual Result<std::vector<WorktreeInfo>> list() = 0;

    // Returns git's description of each pruned (or prunable) entry.
    virtual Result<std::vector<std::string>> prune(bool dry_run) = 0;

    virtual Result<bool> branch_exists(const std::string& branch) = 0;

    // Root of the main working tree.
    virtual const std::filesystem::path& repo_root() const = 0;

    // Shared git directory (.git of the main worktree).
    virtual const std::filesystem::path& common_dir() const = 0;
};
