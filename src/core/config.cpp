#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string scalar(const YAML::Node& node, const std::string& where) {
    if (!node.IsScalar()) throw ConfigError(where + " must be a string");
    return node.as<std::string>();
}

bool boolean(const YAML::Node& node, const std::string& where) {
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigError(where + " must be true or false");
    }
}

long long integer(const YAML::Node& node, const std::string& where) {
    try {
        return node.as<long long>();
    } catch (const YAML::Exception&) {
        throw ConfigError(where + " must be an integer");
    }
}

void check_target(const std::string& target, const std::string& where) {
    fs::path p(target);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory())
        throw ConfigError(fmt::format("{}: target '{}' must be relative to the worktree", where, target));

    fs::path normal = p.lexically_normal();
    if (!normal.empty() && *normal.begin() == "..")
        throw ConfigError(fmt::format("{}: target '{}' escapes the worktree", where, target));
}

SymlinkDefinition parse_mapping(const YAML::Node& node, size_t index) {
    std::string where = fmt::format("files[{}]", index);
    SymlinkDefinition def;

    if (node.IsScalar()) {
        def.source = def.target = node.as<std::string>();
    } else if (node.IsMap()) {
        if (node["path"]) {
            def.source = def.target = scalar(node["path"], where + ".path");
        }
        if (node["source"]) def.source = scalar(node["source"], where + ".source");
        if (node["target"]) def.target = scalar(node["target"], where + ".target");
        if (def.target.empty()) def.target = def.source;

        if (node["mapping_type"]) {
            auto type = parse_mapping_type(scalar(node["mapping_type"], where + ".mapping_type"));
            if (!type) {
                throw ConfigError(fmt::format("{}.mapping_type: expected symlink or copy, got '{}'",
                                              where, node["mapping_type"].as<std::string>()));
            }
            def.mapping_type = *type;
        }
        if (node["skip_if_exists"]) def.skip_if_exists = boolean(node["skip_if_exists"], where + ".skip_if_exists");
        if (node["description"]) def.description = scalar(node["description"], where + ".description");
    } else {
        throw ConfigError(where + " must be a path or a mapping");
    }

    if (def.source.empty()) throw ConfigError(where + " needs a path or source");
    check_target(def.target, where);
    return def;
}

HookDefinition parse_hook(const YAML::Node& node, const std::string& where) {
    HookDefinition hook;

    if (node.IsScalar()) {
        hook.command = node.as<std::string>();
    } else if (node.IsMap()) {
        if (!node["command"]) throw ConfigError(where + " needs a command");
        hook.command = scalar(node["command"], where + ".command");

        if (node["args"]) {
            if (!node["args"].IsSequence()) throw ConfigError(where + ".args must be a list");
            std::vector<std::string> args;
            for (size_t i = 0; i < node["args"].size(); i++) {
                args.push_back(scalar(node["args"][i], fmt::format("{}.args[{}]", where, i)));
            }
            hook.args = std::move(args);
        }

        if (node["timeout"]) {
            long long t = integer(node["timeout"], where + ".timeout");
            if (t < 0) throw ConfigError(where + ".timeout must not be negative");
            hook.timeout_seconds = t == 0 ? DEFAULT_HOOK_TIMEOUT_SECS : static_cast<uint64_t>(t);
        }
        if (node["continue_on_error"])
            hook.continue_on_error = boolean(node["continue_on_error"], where + ".continue_on_error");

        if (node["env"]) {
            if (!node["env"].IsMap()) throw ConfigError(where + ".env must be a mapping");
            for (const auto& kv : node["env"]) {
                hook.env[kv.first.as<std::string>()] = scalar(kv.second, where + ".env");
            }
        }
    } else {
        throw ConfigError(where + " must be a command string or a mapping");
    }

    std::string trimmed = hook.command;
    trim(trimmed);
    if (trimmed.empty()) throw ConfigError(where + " has an empty command");
    return hook;
}

} // namespace

// ── Name parsing ───────────────────────────────────────────────

std::optional<LifecyclePhase> parse_phase(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "pre_add" || n == "pre_create") return LifecyclePhase::PreAdd;
    if (n == "post_add" || n == "post_create") return LifecyclePhase::PostAdd;
    if (n == "pre_remove") return LifecyclePhase::PreRemove;
    if (n == "post_remove") return LifecyclePhase::PostRemove;
    return std::nullopt;
}

std::optional<MappingType> parse_mapping_type(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "symlink") return MappingType::Symlink;
    if (n == "copy") return MappingType::Copy;
    return std::nullopt;
}

std::optional<ErrorHandling> parse_error_handling(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "abort") return ErrorHandling::Abort;
    if (n == "continue") return ErrorHandling::Continue;
    return std::nullopt;
}

std::optional<LinkMode> parse_link_mode(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "auto") return LinkMode::Auto;
    if (n == "copy") return LinkMode::Copy;
    return std::nullopt;
}

// ── Parser ─────────────────────────────────────────────────────

class ConfigParser {
public:
    static Config parse(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) return config;
        if (!root.IsMap()) throw ConfigError("top level must be a mapping");

        auto& s = config.settings_;
        auto& keys = config.explicit_keys_;

        for (const auto& kv : root) {
            std::string key = kv.first.as<std::string>();
            const YAML::Node& value = kv.second;

            if (key == "worktree_base") {
                s.worktree_base = scalar(value, key);
            } else if (key == "branch_prefix") {
                s.branch_prefix = scalar(value, key);
            } else if (key == "error_handling") {
                auto eh = parse_error_handling(scalar(value, key));
                if (!eh) throw ConfigError(fmt::format("error_handling: expected abort or continue, got '{}'",
                                                       value.as<std::string>()));
                s.error_handling = *eh;
            } else if (key == "link_mode") {
                auto mode = parse_link_mode(scalar(value, key));
                if (!mode) throw ConfigError(fmt::format("link_mode: expected auto or copy, got '{}'",
                                                         value.as<std::string>()));
                s.link_mode = *mode;
            } else if (key == "rollback_on_abort") {
                s.rollback_on_abort = boolean(value, key);
            } else if (key == "lock") {
                parse_lock(value, s.lock);
            } else if (key == "files") {
                if (!value.IsNull() && !value.IsSequence()) throw ConfigError("files must be a list");
                for (size_t i = 0; i < value.size(); i++) {
                    s.files.push_back(parse_mapping(value[i], i));
                }
            } else if (key == "hooks") {
                parse_hooks(value, s.hooks, keys);
                continue;
            } else {
                throw ConfigError(fmt::format("unknown key '{}'", key));
            }
            keys.insert(key);
        }
        return config;
    }

private:
    static void parse_lock(const YAML::Node& node, LockSettings& lock) {
        if (!node.IsMap()) throw ConfigError("lock must be a mapping");
        if (node["wait"]) lock.wait = boolean(node["wait"], "lock.wait");
        if (node["timeout_seconds"]) {
            long long t = integer(node["timeout_seconds"], "lock.timeout_seconds");
            if (t < 0) throw ConfigError("lock.timeout_seconds must not be negative");
            const long long max_secs = std::numeric_limits<int>::max() / 1000;
            lock.timeout_seconds = static_cast<int>(std::min(t, max_secs));
        }
    }

    static void parse_hooks(const YAML::Node& node,
                            std::map<LifecyclePhase, std::vector<HookDefinition>>& hooks,
                            std::set<std::string>& keys) {
        if (node.IsNull()) return;
        if (!node.IsMap()) throw ConfigError("hooks must be a mapping");

        for (const auto& kv : node) {
            std::string name = kv.first.as<std::string>();
            auto phase = parse_phase(name);
            if (!phase) throw ConfigError(fmt::format("hooks: unknown phase '{}'", name));

            auto& list = hooks[*phase];
            const YAML::Node& entries = kv.second;
            std::string where = fmt::format("hooks.{}", phase_name(*phase));
            if (entries.IsScalar()) {
                list.push_back(parse_hook(entries, where));
            } else if (entries.IsSequence()) {
                for (size_t i = 0; i < entries.size(); i++) {
                    list.push_back(parse_hook(entries[i], fmt::format("{}[{}]", where, i)));
                }
            } else if (!entries.IsNull()) {
                throw ConfigError(where + " must be a list");
            }
            keys.insert(where);
        }
    }
};

// ── Locations ──────────────────────────────────────────────────

fs::path get_global_config_dir() {
    return platform::config_dir() / GLOBAL_CONFIG_DIR_NAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_NAME;
}

std::optional<fs::path> find_project_config(const fs::path& start) {
    std::error_code ec;
    fs::path dir = fs::absolute(start, ec);
    if (ec) dir = start;

    while (true) {
        for (const char* name : {PROJECT_CONFIG_NAME, PROJECT_CONFIG_HIDDEN_NAME}) {
            fs::path candidate = dir / name;
            if (fs::is_regular_file(candidate, ec)) return candidate;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    return std::nullopt;
}

// ── Loading ────────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text, const std::string& origin) {
    try {
        return Result<Config>::Ok(ConfigParser::parse(YAML::Load(yaml_text)));
    } catch (const ConfigError& e) {
        return Result<Config>::Err(ErrorKind::Config, fmt::format("{}: {}", origin, e.what()));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config, fmt::format("{}: {}", origin, e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::NotFound,
                                   "Config file not found at " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto result = parse(buf.str(), path.string());
    if (result.is_ok()) result.value.source_path_ = path;
    return result;
}

Result<Config> Config::load_global() {
    fs::path path = get_global_config_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) return Result<Config>::Ok(Config{});
    return load_file(path);
}

Result<Config> Config::load_project(const fs::path& dir) {
    auto path = find_project_config(dir);
    if (!path) return Result<Config>::Ok(Config{});
    return load_file(*path);
}

Result<Config> Config::load(const fs::path& project_dir, const std::optional<fs::path>& explicit_path) {
    auto global = load_global();
    if (global.is_err()) return global;

    auto project = explicit_path ? load_file(*explicit_path) : load_project(project_dir);
    if (project.is_err()) {
        if (explicit_path && project.kind == ErrorKind::NotFound) project.kind = ErrorKind::Config;
        return project;
    }

    return Result<Config>::Ok(merge(global.value, project.value));
}

Config Config::merge(const Config& global, const Config& project) {
    Config merged = global;
    const auto& p = project.settings_;
    auto& m = merged.settings_;
    auto has = [&](const char* key) { return project.explicit_keys_.count(key) > 0; };

    if (has("worktree_base")) m.worktree_base = p.worktree_base;
    if (has("branch_prefix")) m.branch_prefix = p.branch_prefix;
    if (has("error_handling")) m.error_handling = p.error_handling;
    if (has("link_mode")) m.link_mode = p.link_mode;
    if (has("rollback_on_abort")) m.rollback_on_abort = p.rollback_on_abort;
    if (has("lock")) m.lock = p.lock;
    if (!p.files.empty()) m.files = p.files;

    for (LifecyclePhase phase : {LifecyclePhase::PreAdd, LifecyclePhase::PostAdd,
                                 LifecyclePhase::PreRemove, LifecyclePhase::PostRemove}) {
        if (project.explicit_keys_.count(fmt::format("hooks.{}", phase_name(phase)))) {
            auto it = p.hooks.find(phase);
            m.hooks[phase] = it == p.hooks.end() ? std::vector<HookDefinition>{} : it->second;
        }
    }

    merged.explicit_keys_.insert(project.explicit_keys_.begin(), project.explicit_keys_.end());
    merged.source_path_ = project.source_path_;
    return merged;
}

Config Config::from_settings(TwinSettings settings) {
    Config config;
    config.settings_ = std::move(settings);
    return config;
}

EffectPlan Config::effect_plan() const {
    EffectPlan plan;
    plan.error_handling = settings_.error_handling;

    auto hooks_for = [&](LifecyclePhase phase) {
        auto it = settings_.hooks.find(phase);
        return it == settings_.hooks.end() ? std::vector<HookDefinition>{} : it->second;
    };

    for (const auto& hook : hooks_for(LifecyclePhase::PreAdd))
        plan.phases[LifecyclePhase::PreAdd].push_back(hook);

    // Links first so post_add hooks can rely on them.
    for (const auto& file : settings_.files)
        plan.phases[LifecyclePhase::PostAdd].push_back(file);
    for (const auto& hook : hooks_for(LifecyclePhase::PostAdd))
        plan.phases[LifecyclePhase::PostAdd].push_back(hook);

    for (const auto& hook : hooks_for(LifecyclePhase::PreRemove))
        plan.phases[LifecyclePhase::PreRemove].push_back(hook);
    for (const auto& file : settings_.files)
        plan.phases[LifecyclePhase::PreRemove].push_back(file);

    for (const auto& hook : hooks_for(LifecyclePhase::PostRemove))
        plan.phases[LifecyclePhase::PostRemove].push_back(hook);

    return plan;
}

std::string Config::to_yaml() const {
    const auto& s = settings_;
    YAML::Emitter out;
    out << YAML::BeginMap;
    if (!s.worktree_base.empty()) out << YAML::Key << "worktree_base" << YAML::Value << s.worktree_base;
    out << YAML::Key << "branch_prefix" << YAML::Value << s.branch_prefix;
    out << YAML::Key << "error_handling" << YAML::Value << error_handling_name(s.error_handling);
    out << YAML::Key << "link_mode" << YAML::Value
        << (s.link_mode == LinkMode::Copy ? "copy" : "auto");
    out << YAML::Key << "rollback_on_abort" << YAML::Value << s.rollback_on_abort;

    out << YAML::Key << "lock" << YAML::Value << YAML::BeginMap
        << YAML::Key << "wait" << YAML::Value << s.lock.wait
        << YAML::Key << "timeout_seconds" << YAML::Value << s.lock.timeout_seconds
        << YAML::EndMap;

    out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : s.files) {
        out << YAML::BeginMap;
        out << YAML::Key << "source" << YAML::Value << f.source;
        out << YAML::Key << "target" << YAML::Value << f.target;
        out << YAML::Key << "mapping_type" << YAML::Value << mapping_type_name(f.mapping_type);
        out << YAML::Key << "skip_if_exists" << YAML::Value << f.skip_if_exists;
        if (!f.description.empty()) out << YAML::Key << "description" << YAML::Value << f.description;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "hooks" << YAML::Value << YAML::BeginMap;
    for (const auto& [phase, hooks] : s.hooks) {
        out << YAML::Key << phase_name(phase) << YAML::Value << YAML::BeginSeq;
        for (const auto& h : hooks) {
            out << YAML::BeginMap;
            out << YAML::Key << "command" << YAML::Value << h.command;
            if (h.args) out << YAML::Key << "args" << YAML::Value << YAML::Flow << *h.args;
            out << YAML::Key << "timeout" << YAML::Value << h.timeout_seconds;
            out << YAML::Key << "continue_on_error" << YAML::Value << h.continue_on_error;
            if (!h.env.empty()) out << YAML::Key << "env" << YAML::Value << h.env;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

// ── Example file ───────────────────────────────────────────────

Result<fs::path> create_example_project_config(const fs::path& dir, bool force) {
    fs::path config_path = dir / PROJECT_CONFIG_NAME;

    std::error_code ec;
    if (fs::exists(config_path, ec) && !force) {
        return Result<fs::path>::Err(ErrorKind::AlreadyExists,
            config_path.string() + " already exists (use --force to overwrite)");
    }

    const char* example = R"(# twin worktree configuration
# Placeholders: {branch} {worktree_path} {source_path} {repo_root} {name}
#               ${BRANCH} ${WORKTREE_PATH} ${PROJECT_ROOT} ${AGENT_NAME}

# Where relative worktree paths are created (relative to the repo root)
# worktree_base: ../worktrees

branch_prefix: agent/
error_handling: abort          # abort | continue
link_mode: auto                # auto | copy
rollback_on_abort: false

lock:
  wait: true
  timeout_seconds: 30

# Shared files linked (or copied) from the repository root into each worktree
files:
  - path: .env
    mapping_type: symlink
    skip_if_exists: true
    description: local environment
  # - source: config/settings.json
  #   target: config/settings.json
  #   mapping_type: copy

hooks:
  pre_add: []
  post_add:
    - "echo created {name} on {branch}"
    # - command: npm
    #   args: [install]
    #   timeout: 300
    #   continue_on_error: true
  pre_remove: []
  post_remove: []
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<fs::path>::Err(ErrorKind::Io,
                "Failed to create config file at " + config_path.string());
        }
        out << example;
        out.close();
        return Result<fs::path>::Ok(config_path);
    } catch (const std::exception& e) {
        return Result<fs::path>::Err(ErrorKind::Io,
            "Failed to write config file: " + std::string(e.what()));
    }
}
