#include "base_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <git/git_worktree_provider.hpp>
#include <platform/link_strategy.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI(RuntimeOptions opts, std::optional<fs::path> path)
    : options(std::move(opts)), config_path(std::move(path)), cwd(fs::current_path()) {}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help,
                          const std::vector<std::string>& aliases) {
    commands_[name] = {handler, help};
    for (const auto& alias : aliases) aliases_[alias] = name;
}

bool BaseCLI::require_config() {
    if (config.has_value()) return true;

    auto result = Config::load(cwd, config_path);
    if (result.is_err()) {
        std::cerr << theme::fail(result.error);
        return false;
    }
    config = result.value;
    return true;
}

bool BaseCLI::require_service() {
    if (service) return true;

    auto issues = run_preflight_checks(cwd, config_path);
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            std::cerr << theme::fail(issue.message);
            std::cerr << theme::step(issue.fix);
        }
        return false;
    }

    if (!require_config()) return false;

    auto provider = GitWorktreeProvider::open(cwd, options);
    if (provider.is_err()) {
        std::cerr << theme::fail(provider.error);
        return false;
    }

    auto links = platform::make_link_strategy(config->settings().link_mode);
    service = std::make_unique<WorktreeService>(config.value(), std::move(provider.value),
                                                std::move(links), options, cwd);
    return true;
}

StatusCallback BaseCLI::status_printer() const {
    return [](const std::string& msg) {
        std::cerr << theme::dim("  " + msg) << "\n";
    };
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    std::string name = command;
    auto alias = aliases_.find(name);
    if (alias != aliases_.end()) name = alias->second;

    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cerr << theme::fail("Unknown command: " + command);
        std::cerr << theme::step("Run 'twin --help' for available commands.");
        return EXIT_USAGE;
    }

    try {
        return it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_FAILED;
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Worktrees", {"add", "list", "remove", "status", "prune"}},
        {"Setup",     {"init", "config"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::SAND << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;

            std::string also;
            for (const auto& [alias, target] : aliases_) {
                if (target == name) also += (also.empty() ? " (" : ", ") + alias;
            }
            if (!also.empty()) also += ")";

            std::cout << theme::color::TEAL
                      << fmt::format("    {:<10}", name)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.second << also
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n";
}
