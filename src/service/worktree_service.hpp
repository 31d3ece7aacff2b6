#pragma once

#include <memory>
#include <optional>
#include <core/config.hpp>
#include <effects/report.hpp>
#include <effects/status.hpp>
#include <git/worktree_provider.hpp>
#include <platform/link_strategy.hpp>
#include <platform/repo_lock.hpp>

struct AddRequest {
    std::string path;              // absolute, or relative to worktree_base / cwd
    std::string branch;            // existing or new branch; empty = generated
    std::string new_branch;        // -b: always create this branch
};

struct RemoveRequest {
    std::string worktree;          // path, directory name or branch
    bool force = false;
};

struct WorktreeStatus {
    WorktreeInfo worktree;
    std::vector<SideEffectStatus> mappings;
};

// Ties the repository lock, the worktree primitive and the effect chains
// together for every command.
class WorktreeService {
public:
    WorktreeService(Config config, std::unique_ptr<WorktreeProvider> provider,
                    std::unique_ptr<platform::LinkStrategy> links, RuntimeOptions options,
                    fs::path cwd = fs::current_path());

    // lock -> pre_add -> git worktree add -> post_add
    OperationReport add(const AddRequest& request, StatusCallback cb = nullptr);

    // lock -> pre_remove -> git worktree remove -> post_remove
    OperationReport remove(const RemoveRequest& request, StatusCallback cb = nullptr);

    Result<std::vector<WorktreeInfo>> list();
    Result<std::vector<std::string>> prune(bool dry_run);

    // Side-effect state of one worktree; empty selector = the one holding cwd.
    Result<WorktreeStatus> status(const std::string& selector);

    // Where `add` would put a worktree for this argument.
    fs::path resolve_worktree_path(const std::string& path_arg) const;

    // <branch_prefix><name>, suffixed -2, -3, ... until unused.
    Result<std::string> generate_branch_name(const std::string& name);

    // Match a path, a directory name or a branch against existing worktrees.
    Result<WorktreeInfo> find_worktree(const std::string& selector);

    const Config& config() const { return config_; }
    WorktreeProvider& provider() { return *provider_; }

private:
    Config config_;
    std::unique_ptr<WorktreeProvider> provider_;
    std::unique_ptr<platform::LinkStrategy> links_;
    RuntimeOptions options_;
    fs::path cwd_;

    Result<std::unique_ptr<RepositoryLock>> lock(StatusCallback& cb);
};
