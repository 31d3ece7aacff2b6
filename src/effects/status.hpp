#pragma once

#include <string>
#include <vector>
#include "context.hpp"
#include <core/types.hpp>

enum class StatusState {
    Ok,
    Missing,
    Warning,
    Error,
};

const char* status_state_name(StatusState state);

// Observed state of one file mapping inside an existing worktree.
struct SideEffectStatus {
    std::string target;
    std::string source;
    MappingType mapping_type = MappingType::Symlink;
    StatusState state = StatusState::Missing;
    std::string detail;
};

// Inspect the filesystem only; nothing is changed.
SideEffectStatus inspect_mapping(const SymlinkDefinition& def, const WorktreeContext& ctx);

std::vector<SideEffectStatus> derive_status(const std::vector<SymlinkDefinition>& mappings,
                                            const WorktreeContext& ctx);
