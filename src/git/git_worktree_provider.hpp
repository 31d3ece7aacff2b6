#pragma once

#include <memory>
#include "worktree_provider.hpp"

// Parse `git worktree list --porcelain` output.
std::vector<WorktreeInfo> parse_worktree_porcelain(const std::string& output);

// WorktreeProvider backed by the git command line.
class GitWorktreeProvider : public WorktreeProvider {
public:
    GitWorktreeProvider(std::filesystem::path repo_root, std::filesystem::path common_dir,
                        const RuntimeOptions& options);

    // Locate the repository containing start_dir.
    static Result<std::unique_ptr<GitWorktreeProvider>> open(const std::filesystem::path& start_dir,
                                                             const RuntimeOptions& options);

    Result<WorktreeInfo> add(const std::filesystem::path& path, const std::string& branch,
                             const AddWorktreeOptions& options) override;
    Result<void> remove(const std::filesystem::path& path,
                        const RemoveWorktreeOptions& options) override;
    Result<std::vector<WorktreeInfo>> list() override;
    Result<std::vector<std::string>> prune(bool dry_run) override;
    Result<bool> branch_exists(const std::string& branch) override;

    const std::filesystem::path& repo_root() const override { return repo_root_; }
    const std::filesystem::path& common_dir() const override { return common_dir_; }

private:
    std::filesystem::path repo_root_;
    std::filesystem::path common_dir_;
    RuntimeOptions options_;

    ProcessResult git(const std::vector<std::string>& args) const;
};

// True if git can be executed at all.
bool git_available();
