#pragma once

#include <string>
#include <map>
#include "context.hpp"

// Replace the known placeholders in a hook command or path template:
//   {branch}        ${BRANCH}          branch name
//   {worktree_path} ${WORKTREE_PATH}   worktree directory
//   {source_path}   {repo_root}        repository root
//   ${PROJECT_ROOT}                    repository root
//   {name}          ${AGENT_NAME}      worktree directory name
// Anything else in braces is copied through untouched. Single pass:
// substituted values are never rescanned.
std::string substitute_placeholders(const std::string& tmpl, const WorktreeContext& ctx);

// TWIN_* variables exported to every hook process.
std::map<std::string, std::string> context_environment(const WorktreeContext& ctx);
