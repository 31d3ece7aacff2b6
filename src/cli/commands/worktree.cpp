#include "../base_cli.hpp"
#include "../args.hpp"
#include "../report_view.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static int usage(const std::string& error, const std::string& line) {
    if (!error.empty()) std::cerr << theme::fail(error);
    std::cerr << theme::step("Usage: " + line);
    return EXIT_USAGE;
}

static int do_add(BaseCLI& cli, const std::vector<std::string>& args) {
    const char* line = "twin add <path> [branch] [-b <new-branch>] [--print-path | --cd-command]";
    ArgSpec spec{{"--print-path", "--cd-command"}, {"--new-branch"}, {{"-b", "--new-branch"}}};
    auto parsed = parse_args(args, spec);
    if (!parsed.error.empty()) return usage(parsed.error, line);
    if (parsed.positional.empty()) return usage("Missing worktree path.", line);
    if (parsed.positional.size() > 2) return usage("Too many arguments.", line);
    if (parsed.has("--print-path") && parsed.has("--cd-command"))
        return usage("--print-path and --cd-command are exclusive.", line);
    if (parsed.options.count("--new-branch") && parsed.positional.size() == 2)
        return usage("Give the branch either positionally or with -b, not both.", line);

    if (!cli.require_service()) return EXIT_FAILED;

    AddRequest request;
    request.path = parsed.arg(0);
    request.branch = parsed.arg(1);
    request.new_branch = parsed.get("--new-branch");

    // Path-only output goes to stdout untouched so shells can capture it.
    bool quiet = parsed.has("--print-path") || parsed.has("--cd-command");
    auto report = cli.service->add(request, quiet ? StatusCallback() : cli.status_printer());

    if (quiet) {
        if (!report.success()) {
            print_report(report, std::cerr);
            return report.exit_code();
        }
        if (parsed.has("--cd-command"))
            std::cout << "cd " << quote_path(report.worktree_path()) << "\n";
        else
            std::cout << report.worktree_path() << "\n";
        return EXIT_OK;
    }

    print_report(report);
    if (report.success()) {
        std::cout << theme::step("cd " + quote_path(report.worktree_path()));
    }
    return report.exit_code();
}

static int do_list(BaseCLI& cli, const std::vector<std::string>& args) {
    const char* line = "twin list [--format table|simple|yaml|json]";
    ArgSpec spec{{}, {"--format"}, {}};
    auto parsed = parse_args(args, spec);
    if (!parsed.error.empty()) return usage(parsed.error, line);
    if (!parsed.positional.empty()) return usage("Unexpected argument: " + parsed.arg(0), line);

    ListFormat format = ListFormat::Table;
    if (!parse_list_format(parsed.get("--format", "table"), format))
        return usage("Unknown format: " + parsed.get("--format"), line);

    if (!cli.require_service()) return EXIT_FAILED;

    auto listed = cli.service->list();
    if (listed.is_err()) {
        std::cerr << theme::fail(listed.error);
        return EXIT_FAILED;
    }
    print_worktrees(listed.value, format);
    return EXIT_OK;
}

static int do_remove(BaseCLI& cli, const std::vector<std::string>& args) {
    const char* line = "twin remove <path-or-name> [--force]";
    ArgSpec spec{{"--force"}, {}, {{"-f", "--force"}}};
    auto parsed = parse_args(args, spec);
    if (!parsed.error.empty()) return usage(parsed.error, line);
    if (parsed.positional.size() != 1) return usage("Expected exactly one worktree.", line);

    if (!cli.require_service()) return EXIT_FAILED;

    RemoveRequest request;
    request.worktree = parsed.arg(0);
    request.force = parsed.has("--force");

    auto report = cli.service->remove(request, cli.status_printer());
    print_report(report);
    return report.exit_code();
}

static int do_status(BaseCLI& cli, const std::vector<std::string>& args) {
    const char* line = "twin status [path-or-name]";
    auto parsed = parse_args(args, ArgSpec{});
    if (!parsed.error.empty()) return usage(parsed.error, line);
    if (parsed.positional.size() > 1) return usage("Too many arguments.", line);

    if (!cli.require_service()) return EXIT_FAILED;

    auto status = cli.service->status(parsed.arg(0));
    if (status.is_err()) {
        std::cerr << theme::fail(status.error);
        return EXIT_FAILED;
    }
    print_status(status.value);
    return EXIT_OK;
}

static int do_prune(BaseCLI& cli, const std::vector<std::string>& args) {
    const char* line = "twin prune [--dry-run]";
    auto parsed = parse_args(args, ArgSpec{{"--dry-run"}, {}, {{"-n", "--dry-run"}}});
    if (!parsed.error.empty()) return usage(parsed.error, line);
    if (!parsed.positional.empty()) return usage("Unexpected argument: " + parsed.arg(0), line);

    if (!cli.require_service()) return EXIT_FAILED;

    bool dry_run = parsed.has("--dry-run") || cli.options.dry_run;
    auto pruned = cli.service->prune(dry_run);
    if (pruned.is_err()) {
        std::cerr << theme::fail(pruned.error);
        return EXIT_FAILED;
    }

    if (pruned.value.empty()) {
        std::cout << theme::ok("Nothing to prune.");
        return EXIT_OK;
    }
    for (const auto& entry : pruned.value) {
        std::cout << (dry_run ? theme::info(entry) : theme::ok(entry));
    }
    return EXIT_OK;
}

void register_worktree_commands(BaseCLI& cli) {
    cli.add_command("add", do_add, "Create a worktree and run its setup", {"create"});
    cli.add_command("list", do_list, "List worktrees", {"ls"});
    cli.add_command("remove", do_remove, "Tear down and remove a worktree", {"rm", "delete"});
    cli.add_command("status", do_status, "Show shared-file state of a worktree");
    cli.add_command("prune", do_prune, "Prune stale worktree metadata");
}
