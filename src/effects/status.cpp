#include "status.hpp"
#include "symlink_effect.hpp"
#include <fmt/format.h>

namespace fs = std::filesystem;

const char* status_state_name(StatusState state) {
    switch (state) {
        case StatusState::Ok:      return "ok";
        case StatusState::Missing: return "missing";
        case StatusState::Warning: return "warning";
        case StatusState::Error:   return "error";
    }
    return "unknown";
}

SideEffectStatus inspect_mapping(const SymlinkDefinition& def, const WorktreeContext& ctx) {
    fs::path source = resolve_mapping_source(def, ctx);
    fs::path target = resolve_mapping_target(def, ctx);

    SideEffectStatus st;
    st.source = source.string();
    st.target = target.string();
    st.mapping_type = def.mapping_type;

    std::error_code ec;
    auto target_status = fs::symlink_status(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        st.state = StatusState::Error;
        st.detail = ec.message();
        return st;
    }
    bool present = target_status.type() != fs::file_type::not_found &&
                   target_status.type() != fs::file_type::none;
    bool source_present = fs::exists(source, ec);

    if (!present) {
        st.state = source_present ? StatusState::Missing : StatusState::Warning;
        st.detail = source_present ? "not created" : "source missing, nothing to link";
        return st;
    }

    if (def.mapping_type == MappingType::Copy) {
        if (fs::is_symlink(target_status)) {
            st.state = StatusState::Warning;
            st.detail = "symlink where a copy is expected";
        } else {
            st.state = StatusState::Ok;
            st.detail = "copy present";
        }
        return st;
    }

    if (!fs::is_symlink(target_status)) {
        st.state = StatusState::Warning;
        st.detail = "copy present (fallback or replaced by hand)";
        return st;
    }

    fs::path points_to = fs::read_symlink(target, ec);
    if (ec) {
        st.state = StatusState::Error;
        st.detail = ec.message();
        return st;
    }
    if (points_to.is_relative()) points_to = target.parent_path() / points_to;
    points_to = points_to.lexically_normal();

    if (!fs::exists(points_to, ec)) {
        st.state = StatusState::Error;
        st.detail = fmt::format("dangling link to {}", points_to.string());
    } else if (points_to != source) {
        st.state = StatusState::Warning;
        st.detail = fmt::format("points to {}", points_to.string());
    } else {
        st.state = StatusState::Ok;
        st.detail = "linked";
    }
    return st;
}

std::vector<SideEffectStatus> derive_status(const std::vector<SymlinkDefinition>& mappings,
                                            const WorktreeContext& ctx) {
    std::vector<SideEffectStatus> out;
    out.reserve(mappings.size());
    for (const auto& def : mappings) out.push_back(inspect_mapping(def, ctx));
    return out;
}
