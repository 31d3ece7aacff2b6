#pragma once

#include <string>
#include <filesystem>

// Everything an effect may know about the worktree it acts on.
// Built once per command and never mutated afterwards.
class WorktreeContext {
public:
    WorktreeContext(std::string branch_name,
                    std::filesystem::path worktree_path,
                    std::filesystem::path source_path)
        : branch_name_(std::move(branch_name)),
          worktree_path_(std::move(worktree_path)),
          source_path_(std::move(source_path)) {}

    const std::string& branch_name() const { return branch_name_; }
    const std::filesystem::path& worktree_path() const { return worktree_path_; }

    // Repository root the worktree was created from.
    const std::filesystem::path& source_path() const { return source_path_; }

    // Worktree directory name, e.g. "feature-x" for /tmp/wt/feature-x.
    std::string name() const {
        auto p = worktree_path_;
        if (!p.has_filename()) p = p.parent_path();
        return p.filename().string();
    }

private:
    std::string branch_name_;
    std::filesystem::path worktree_path_;
    std::filesystem::path source_path_;
};
