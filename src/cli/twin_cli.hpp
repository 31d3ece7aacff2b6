#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_worktree_commands(BaseCLI& cli);
void register_config_commands(BaseCLI& cli);

class TwinCLI : public BaseCLI {
public:
    TwinCLI(RuntimeOptions options, std::optional<fs::path> config_path);

    int run_command(const std::string& command, const std::vector<std::string>& args);

    void print_usage() const;

private:
    void register_all_commands();
};
