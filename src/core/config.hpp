#pragma once

#include <string>
#include <optional>
#include <set>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct LockSettings {
    bool wait = true;
    int timeout_seconds = DEFAULT_LOCK_TIMEOUT_SECS;  // 0 = wait forever
};

// Parsed twin.yaml. Hook lists and file mappings keep declaration order.
struct TwinSettings {
    std::string worktree_base;                 // empty = current directory
    std::string branch_prefix = DEFAULT_BRANCH_PREFIX;
    ErrorHandling error_handling = ErrorHandling::Abort;
    LinkMode link_mode = LinkMode::Auto;
    bool rollback_on_abort = false;
    LockSettings lock;
    std::vector<SymlinkDefinition> files;
    std::map<LifecyclePhase, std::vector<HookDefinition>> hooks;
};

class Config {
public:
    Config() = default;

    // Load global config from $XDG_CONFIG_HOME/twin/config.yaml.
    // A missing file yields defaults.
    static Result<Config> load_global();

    // Load the nearest twin.yaml / .twin.yaml at or above dir.
    // A missing file yields defaults.
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text; origin is only used in error messages.
    static Result<Config> parse(const std::string& yaml_text, const std::string& origin = "<string>");

    // Global then project, project keys win. explicit_path replaces the
    // project lookup and must exist.
    static Result<Config> load(const fs::path& project_dir = fs::current_path(),
                               const std::optional<fs::path>& explicit_path = std::nullopt);

    static Config merge(const Config& global, const Config& project);

    const TwinSettings& settings() const { return settings_; }

    // File the project settings came from, empty when none was found.
    const fs::path& source_path() const { return source_path_; }

    // Effect definitions per phase: post_add gets the file mappings then
    // the post_add hooks; pre_remove gets the pre_remove hooks then the
    // unlink counterparts of the mappings.
    EffectPlan effect_plan() const;

    // Effective configuration rendered back as YAML.
    std::string to_yaml() const;

    // Test seam.
    static Config from_settings(TwinSettings settings);

private:
    TwinSettings settings_;
    fs::path source_path_;
    std::set<std::string> explicit_keys_;      // keys present in the parsed file

    friend class ConfigParser;
};

// Nearest project config walking up from start, if any.
std::optional<fs::path> find_project_config(const fs::path& start);

fs::path get_global_config_dir();
fs::path get_global_config_path();

// Write a commented example twin.yaml. Refuses to overwrite unless force.
Result<fs::path> create_example_project_config(const fs::path& dir, bool force);

// Parse helpers shared with the CLI.
std::optional<LifecyclePhase> parse_phase(const std::string& name);
std::optional<MappingType> parse_mapping_type(const std::string& name);
std::optional<ErrorHandling> parse_error_handling(const std::string& name);
std::optional<LinkMode> parse_link_mode(const std::string& name);
