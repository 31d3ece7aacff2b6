#include "report_view.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <iostream>
#include <fmt/format.h>

static std::string kind_colored(const EffectResult& r) {
    std::string label = effect_kind_name(r.kind);
    if (r.kind == EffectKind::Success && r.error_kind == ErrorKind::EffectRecoverable)
        label = "fallback";
    switch (r.kind) {
        case EffectKind::Success:
            return (r.error_kind == ErrorKind::EffectRecoverable ? theme::color::YELLOW
                                                                  : theme::color::GREEN) + label;
        case EffectKind::Skipped: return theme::color::DIM + label;
        case EffectKind::Warning: return theme::color::YELLOW + label;
        case EffectKind::Failure: return theme::color::RED + label;
    }
    return label;
}

static size_t visible_kind_width(const EffectResult& r) {
    if (r.kind == EffectKind::Success && r.error_kind == ErrorKind::EffectRecoverable)
        return 8;  // "fallback"
    return std::string(effect_kind_name(r.kind)).size();
}

void print_report(const OperationReport& report, std::ostream& out) {
    const auto& git = report.git();
    if (git.attempted) {
        out << (git.success ? theme::ok(git.message) : theme::fail(git.message));
    } else if (!git.message.empty()) {
        out << theme::warn(git.message);
    }

    struct Row { std::string phase; const EffectResult* r; };
    std::vector<Row> rows;
    for (const auto& phase : report.phases()) {
        for (const auto& r : phase.results) rows.push_back({phase_name(phase.phase), &r});
    }

    if (!rows.empty()) {
        // Compute column widths from headers and data
        size_t w0 = 5, w1 = 4, w2 = 8, w3 = 6;
        for (const auto& row : rows) {
            w0 = std::max(w0, row.phase.size());
            w1 = std::max(w1, row.r->effect_type.size());
            w3 = std::max(w3, std::min<size_t>(row.r->target.size(), 48));
        }

        std::string hfmt = fmt::format("  {{:<{}}} {{:<{}}} {{:<{}}} {{:<{}}} {{:<8}} {{}}\n",
                                       w0 + 2, w1 + 2, w2 + 2, w3 + 2);
        out << "\n" << theme::color::DIM
                  << fmt::format(fmt::runtime(hfmt), "PHASE", "TYPE", "STATUS", "TARGET", "TIME", "MESSAGE")
                  << theme::color::RESET;

        std::string lfmt = fmt::format("  {{:<{}}} {{:<{}}} ", w0 + 2, w1 + 2);
        std::string rfmt = fmt::format("{{:<{}}} {{:<8}} {{}}\n", w3 + 2);
        for (const auto& row : rows) {
            const EffectResult& r = *row.r;
            // Pad manually for status since it has ANSI codes
            out << fmt::format(fmt::runtime(lfmt), row.phase, r.effect_type)
                      << kind_colored(r) << theme::color::RESET
                      << std::string(w2 + 2 - visible_kind_width(r) + 1, ' ')
                      << fmt::format(fmt::runtime(rfmt), truncate(r.target, 48),
                                     format_elapsed(r.duration),
                                     truncate(single_line(r.message), REPORT_MESSAGE_MAX));
        }
        out << "\n";
    }

    if (!report.error().empty() && report.error_kind() != ErrorKind::GitOperation) {
        out << theme::fail(fmt::format("[{}] {}", error_kind_name(report.error_kind()),
                                             report.error()));
    }

    if (const PhaseReport* aborted = report.aborted_phase()) {
        out << theme::fail(fmt::format("{} aborted: {}", phase_name(aborted->phase),
                                             aborted->abort_error));
    }

    for (const auto& err : report.rollback_errors()) {
        out << theme::fail("rollback: " + err);
    }

    if (!report.phases().empty()) {
        std::string summary = report.summary();
        size_t fallbacks = report.fallback_count();
        if (fallbacks > 0) summary += fmt::format(" ({} copied instead of linked)", fallbacks);
        out << theme::kv("summary", summary);
    }

    std::string advice = report.remediation();
    if (!advice.empty()) out << theme::step(advice);
}

bool parse_list_format(const std::string& name, ListFormat& out) {
    std::string n = to_lower(name);
    if (n == "table") out = ListFormat::Table;
    else if (n == "simple") out = ListFormat::Simple;
    else if (n == "yaml") out = ListFormat::Yaml;
    else if (n == "json") out = ListFormat::Json;
    else return false;
    return true;
}

static std::string worktree_flags(const WorktreeInfo& wt) {
    std::string flags;
    auto add = [&](bool on, const char* name) {
        if (!on) return;
        if (!flags.empty()) flags += ",";
        flags += name;
    };
    add(wt.bare, "bare");
    add(wt.detached, "detached");
    add(wt.locked, "locked");
    add(wt.prunable, "prunable");
    return flags;
}

std::string worktrees_document(const std::vector<WorktreeInfo>& worktrees, ListFormat format) {
    YAML::Emitter out;
    if (format == ListFormat::Json) {
        out.SetSeqFormat(YAML::Flow);
        out.SetMapFormat(YAML::Flow);
        out.SetStringFormat(YAML::DoubleQuoted);
        out.SetBoolFormat(YAML::TrueFalseBool);
    }
    out << YAML::BeginSeq;
    for (const auto& wt : worktrees) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << wt.path;
        out << YAML::Key << "branch" << YAML::Value << wt.branch;
        out << YAML::Key << "commit" << YAML::Value << wt.commit;
        out << YAML::Key << "bare" << YAML::Value << wt.bare;
        out << YAML::Key << "detached" << YAML::Value << wt.detached;
        out << YAML::Key << "locked" << YAML::Value << wt.locked;
        out << YAML::Key << "prunable" << YAML::Value << wt.prunable;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    return out.c_str();
}

void print_worktrees(const std::vector<WorktreeInfo>& worktrees, ListFormat format) {
    if (format == ListFormat::Simple) {
        for (const auto& wt : worktrees) std::cout << wt.path << "\n";
        return;
    }

    if (format == ListFormat::Yaml || format == ListFormat::Json) {
        std::cout << worktrees_document(worktrees, format) << "\n";
        return;
    }

    if (worktrees.empty()) {
        std::cout << theme::dim("  No worktrees.") << "\n";
        return;
    }

    size_t w0 = 4, w1 = 6;
    for (const auto& wt : worktrees) {
        w0 = std::max(w0, wt.path.size());
        w1 = std::max(w1, wt.branch.empty() ? size_t(10) : wt.branch.size());
    }
    std::string rfmt = fmt::format("  {{:<{}}} {{:<{}}} {{:<9}} {{}}\n", w0 + 2, w1 + 2);

    std::cout << "\n" << theme::color::DIM
              << fmt::format(fmt::runtime(rfmt), "PATH", "BRANCH", "COMMIT", "FLAGS")
              << theme::color::RESET;
    for (const auto& wt : worktrees) {
        std::string branch = wt.branch.empty() ? "(detached)" : wt.branch;
        std::cout << fmt::format(fmt::runtime(rfmt), wt.path, branch,
                                 wt.commit.substr(0, 8), worktree_flags(wt));
    }
    std::cout << "\n";
}

void print_status(const WorktreeStatus& status) {
    std::cout << theme::section("Worktree");
    std::cout << theme::kv("path", status.worktree.path);
    std::cout << theme::kv("branch", status.worktree.branch.empty() ? "(detached)"
                                                                    : status.worktree.branch);

    std::cout << theme::section("Shared files");
    if (status.mappings.empty()) {
        std::cout << theme::dim("    No file mappings configured.") << "\n\n";
        return;
    }

    for (const auto& m : status.mappings) {
        std::string line = fmt::format("{} {}", m.target, theme::dim("(" + m.detail + ")"));
        switch (m.state) {
            case StatusState::Ok:      std::cout << theme::ok(line); break;
            case StatusState::Missing: std::cout << theme::info(line); break;
            case StatusState::Warning: std::cout << theme::warn(line); break;
            case StatusState::Error:   std::cout << theme::fail(line); break;
        }
    }
    std::cout << "\n";
}
