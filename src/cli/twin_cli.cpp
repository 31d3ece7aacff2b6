#include "twin_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

TwinCLI::TwinCLI(RuntimeOptions options, std::optional<fs::path> config_path)
    : BaseCLI(std::move(options), std::move(config_path)) {
    register_all_commands();
}

void TwinCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::vector<std::string>&) {
        this->print_usage();
        return EXIT_OK;
    }, "Show this help message");

    register_worktree_commands(*this);
    register_config_commands(*this);
}

int TwinCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    twin_log(fmt::format("command {} args={} dry_run={}", command, args.size(), options.dry_run));
    return execute_command(command, args);
}

void TwinCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    twin "
              << theme::color::RESET << theme::color::SAND << "[--verbose] [--dry-run] [--config <file>] "
              << theme::color::RESET << "<command> [args]\n";

    print_help();

    std::cout << theme::color::DIM
              << "    twin add <path> [branch] [-b <new-branch>] [--print-path | --cd-command]\n"
              << "    twin list [--format table|simple|yaml|json]\n"
              << "    twin remove <path-or-name> [--force]\n"
              << "    twin status [path-or-name]\n"
              << "    twin prune [--dry-run]\n"
              << "    twin init [path] [--force]\n"
              << "    twin config [--show]\n\n"
              << "    twin --version        Show version\n"
              << "    twin --help           Show this help"
              << theme::color::RESET << "\n\n";
}
