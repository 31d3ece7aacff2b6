#include "preflight.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <git/git_worktree_provider.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

std::vector<PreflightIssue> check_git() {
    std::vector<PreflightIssue> issues;
    if (!git_available()) {
        issues.push_back({"git was not found on PATH", "Install git 2.17 or newer"});
    }
    return issues;
}

std::vector<PreflightIssue> check_repository(const std::filesystem::path& cwd) {
    std::vector<PreflightIssue> issues;

    platform::SpawnOptions opts;
    opts.cwd = cwd;
    opts.capture_output = true;
    auto r = platform::run_captured("git", {"rev-parse", "--is-inside-work-tree"}, opts, 10000);
    if (r.failed()) {
        issues.push_back({
            fmt::format("{} is not inside a git repository", cwd.string()),
            "cd into a repository, or run 'git init' first"
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_config(const std::filesystem::path& cwd,
                                         const std::optional<std::filesystem::path>& config_path) {
    std::vector<PreflightIssue> issues;

    auto global = Config::load_global();
    if (global.is_err()) {
        issues.push_back({"Failed to parse global config: " + global.error,
                          "Fix or delete " + get_global_config_path().string()});
    }

    auto project = config_path ? Config::load_file(*config_path) : Config::load_project(cwd);
    if (project.is_err()) {
        std::string fix = project.kind == ErrorKind::NotFound
            ? "Check the --config path"
            : fmt::format("Fix {} (see 'twin init' for an example)", PROJECT_CONFIG_NAME);
        issues.push_back({"Failed to load project config: " + project.error, fix});
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const std::filesystem::path& cwd,
                                                 const std::optional<std::filesystem::path>& config_path) {
    std::vector<PreflightIssue> all;

    // No point looking for a repository without git
    auto git_issues = check_git();
    all.insert(all.end(), git_issues.begin(), git_issues.end());
    if (!all.empty()) return all;

    auto repo_issues = check_repository(cwd);
    all.insert(all.end(), repo_issues.begin(), repo_issues.end());

    auto config_issues = check_config(cwd, config_path);
    all.insert(all.end(), config_issues.begin(), config_issues.end());

    return all;
}
