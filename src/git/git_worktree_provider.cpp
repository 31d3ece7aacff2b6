#include "git_worktree_provider.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <sstream>

namespace fs = std::filesystem;

static constexpr int GIT_TIMEOUT_MS = 120000;

static std::string join_args(const std::vector<std::string>& args) {
    std::string out = "git";
    for (const auto& a : args) out += " " + a;
    return out;
}

static std::string git_error(const std::string& what, const ProcessResult& r) {
    std::string detail = single_line(r.stderr_data.empty() ? r.stdout_data : r.stderr_data);
    if (r.timed_out) detail = "timed out";
    if (detail.empty()) detail = fmt::format("exit code {}", r.exit_code);
    return fmt::format("{} failed: {}", what, detail);
}

static std::string strip_ref(const std::string& ref) {
    const std::string prefix = "refs/heads/";
    return ref.compare(0, prefix.size(), prefix) == 0 ? ref.substr(prefix.size()) : ref;
}

std::vector<WorktreeInfo> parse_worktree_porcelain(const std::string& output) {
    std::vector<WorktreeInfo> worktrees;
    std::istringstream in(output);
    std::string line;
    WorktreeInfo current;
    bool open = false;

    auto flush = [&]() {
        if (open) worktrees.push_back(current);
        current = WorktreeInfo{};
        open = false;
    };

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            flush();
            continue;
        }

        auto space = line.find(' ');
        std::string key = line.substr(0, space);
        std::string value = space == std::string::npos ? "" : line.substr(space + 1);

        if (key == "worktree") {
            flush();
            current.path = value;
            open = true;
        } else if (key == "HEAD") {
            current.commit = value;
        } else if (key == "branch") {
            current.branch = strip_ref(value);
        } else if (key == "detached") {
            current.detached = true;
        } else if (key == "bare") {
            current.bare = true;
        } else if (key == "locked") {
            current.locked = true;
        } else if (key == "prunable") {
            current.prunable = true;
        }
    }
    flush();
    return worktrees;
}

bool git_available() {
    platform::SpawnOptions spawn_opts;
    spawn_opts.capture_output = true;
    auto r = platform::run_captured("git", {"--version"}, spawn_opts, 10000);
    return r.success();
}

GitWorktreeProvider::GitWorktreeProvider(fs::path repo_root, fs::path common_dir,
                                         const RuntimeOptions& options)
    : repo_root_(std::move(repo_root)), common_dir_(std::move(common_dir)), options_(options) {}

Result<std::unique_ptr<GitWorktreeProvider>> GitWorktreeProvider::open(const fs::path& start_dir,
                                                                       const RuntimeOptions& options) {
    using R = Result<std::unique_ptr<GitWorktreeProvider>>;

    platform::SpawnOptions spawn_opts;
    spawn_opts.cwd = start_dir;
    spawn_opts.capture_output = true;

    auto top = platform::run_captured("git", {"rev-parse", "--show-toplevel"}, spawn_opts, GIT_TIMEOUT_MS);
    twin_log_process("git", "git rev-parse --show-toplevel", top);
    if (top.failed()) {
        return R::Err(ErrorKind::NotFound,
                      fmt::format("{} is not inside a git repository", start_dir.string()));
    }

    auto common = platform::run_captured("git", {"rev-parse", "--git-common-dir"}, spawn_opts, GIT_TIMEOUT_MS);
    twin_log_process("git", "git rev-parse --git-common-dir", common);
    if (common.failed()) {
        return R::Err(ErrorKind::GitOperation, git_error("git rev-parse --git-common-dir", common));
    }

    std::string top_str = top.stdout_data;
    std::string common_str = common.stdout_data;
    trim(top_str);
    trim(common_str);

    fs::path common_dir(common_str);
    if (common_dir.is_relative()) common_dir = start_dir / common_dir;
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(common_dir, ec);
    if (!ec) common_dir = canonical;

    // From a linked worktree --show-toplevel names that worktree; the
    // main working tree is the one owning the common dir.
    fs::path root(top_str);
    if (common_dir.filename() == ".git") root = common_dir.parent_path();

    return R::Ok(std::make_unique<GitWorktreeProvider>(root.lexically_normal(),
                                                       common_dir.lexically_normal(), options));
}

ProcessResult GitWorktreeProvider::git(const std::vector<std::string>& args) const {
    platform::SpawnOptions spawn_opts;
    spawn_opts.cwd = repo_root_;
    spawn_opts.capture_output = true;

    auto r = platform::run_captured("git", args, spawn_opts, GIT_TIMEOUT_MS);
    twin_log_process("git", join_args(args), r);
    return r;
}

Result<WorktreeInfo> GitWorktreeProvider::add(const fs::path& path, const std::string& branch,
                                              const AddWorktreeOptions& options) {
    std::vector<std::string> args = {"worktree", "add"};
    if (options.force) args.push_back("--force");
    if (options.create_branch) {
        args.push_back("-b");
        args.push_back(branch);
        args.push_back(path.string());
        if (!options.start_point.empty()) args.push_back(options.start_point);
    } else {
        args.push_back(path.string());
        args.push_back(branch);
    }

    WorktreeInfo info;
    info.path = path.string();
    info.branch = branch;

    if (options_.dry_run) {
        twin_log("[dry run] " + join_args(args));
        return Result<WorktreeInfo>::Ok(info);
    }

    auto r = git(args);
    if (r.failed()) {
        return Result<WorktreeInfo>::Err(ErrorKind::GitOperation, git_error("git worktree add", r));
    }

    auto listed = list();
    if (listed.is_ok()) {
        std::error_code ec;
        for (const auto& wt : listed.value) {
            if (fs::equivalent(wt.path, path, ec)) return Result<WorktreeInfo>::Ok(wt);
        }
    }
    return Result<WorktreeInfo>::Ok(info);
}

Result<void> GitWorktreeProvider::remove(const fs::path& path, const RemoveWorktreeOptions& options) {
    std::vector<std::string> args = {"worktree", "remove"};
    if (options.force) args.push_back("--force");
    args.push_back(path.string());

    if (options_.dry_run) {
        twin_log("[dry run] " + join_args(args));
        return Result<void>::Ok();
    }

    auto r = git(args);
    if (r.failed()) {
        return Result<void>::Err(ErrorKind::GitOperation, git_error("git worktree remove", r));
    }
    return Result<void>::Ok();
}

Result<std::vector<WorktreeInfo>> GitWorktreeProvider::list() {
    auto r = git({"worktree", "list", "--porcelain"});
    if (r.failed()) {
        return Result<std::vector<WorktreeInfo>>::Err(ErrorKind::GitOperation,
                                                      git_error("git worktree list", r));
    }
    return Result<std::vector<WorktreeInfo>>::Ok(parse_worktree_porcelain(r.stdout_data));
}

Result<std::vector<std::string>> GitWorktreeProvider::prune(bool dry_run) {
    std::vector<std::string> args = {"worktree", "prune", "--verbose"};
    if (dry_run || options_.dry_run) args.push_back("--dry-run");

    auto r = git(args);
    if (r.failed()) {
        return Result<std::vector<std::string>>::Err(ErrorKind::GitOperation,
                                                     git_error("git worktree prune", r));
    }

    // git reports pruned entries on stderr (older versions) or stdout.
    std::vector<std::string> entries;
    std::istringstream in(r.stdout_data + "\n" + r.stderr_data);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (!line.empty()) entries.push_back(line);
    }
    return Result<std::vector<std::string>>::Ok(entries);
}

Result<bool> GitWorktreeProvider::branch_exists(const std::string& branch) {
    auto r = git({"show-ref", "--verify", "--quiet", "refs/heads/" + branch});
    if (r.exit_code == 0) return Result<bool>::Ok(true);
    if (r.exit_code == 1 && !r.timed_out && !r.spawn_failed) return Result<bool>::Ok(false);
    return Result<bool>::Err(ErrorKind::GitOperation, git_error("git show-ref", r));
}
