#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
};

// Runs all preflight checks before a repository command.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const std::filesystem::path& cwd,
                                                 const std::optional<std::filesystem::path>& config_path);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_git();
std::vector<PreflightIssue> check_repository(const std::filesystem::path& cwd);
std::vector<PreflightIssue> check_config(const std::filesystem::path& cwd,
                                         const std::optional<std::filesystem::path>& config_path);
