#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <core/config.hpp>
#include <service/worktree_service.hpp>

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

class BaseCLI {
public:
    BaseCLI(RuntimeOptions options, std::optional<fs::path> config_path);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help,
                     const std::vector<std::string>& aliases = {});

    // Load and merge configuration; prints the error on failure.
    bool require_config();

    // Preflight, configuration and repository discovery. Builds `service`.
    bool require_service();

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Echo for status callbacks
    StatusCallback status_printer() const;

    // Public state
    RuntimeOptions options;
    std::optional<fs::path> config_path;
    fs::path cwd;
    std::optional<Config> config;
    std::unique_ptr<WorktreeService> service;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::map<std::string, std::string> aliases_;
};
