#include "worktree_service.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <effects/effect_chain.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>

namespace fs = std::filesystem;

static fs::path normalized(const fs::path& p) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(p, ec);
    return (ec ? p : canonical).lexically_normal();
}

static bool same_path(const fs::path& a, const fs::path& b) {
    return normalized(a) == normalized(b);
}

static void notify(const StatusCallback& cb, const std::string& msg) {
    if (cb) cb(msg);
}

WorktreeService::WorktreeService(Config config, std::unique_ptr<WorktreeProvider> provider,
                                 std::unique_ptr<platform::LinkStrategy> links,
                                 RuntimeOptions options, fs::path cwd)
    : config_(std::move(config)),
      provider_(std::move(provider)),
      links_(std::move(links)),
      options_(options),
      cwd_(std::move(cwd)) {}

fs::path WorktreeService::resolve_worktree_path(const std::string& path_arg) const {
    fs::path p(path_arg);
    if (p.is_absolute()) return p.lexically_normal();

    const auto& base = config_.settings().worktree_base;
    if (!base.empty()) {
        fs::path base_path(base);
        if (base_path.is_relative()) base_path = provider_->repo_root() / base_path;
        return (base_path / p).lexically_normal();
    }
    return (cwd_ / p).lexically_normal();
}

Result<std::string> WorktreeService::generate_branch_name(const std::string& name) {
    std::string base = config_.settings().branch_prefix + name;
    for (int attempt = 1; attempt <= UNIQUE_BRANCH_MAX_ATTEMPTS; attempt++) {
        std::string candidate = attempt == 1 ? base : fmt::format("{}-{}", base, attempt);
        auto exists = provider_->branch_exists(candidate);
        if (exists.is_err()) return Result<std::string>::Err(exists.kind, exists.error);
        if (!exists.value) return Result<std::string>::Ok(candidate);
    }
    return Result<std::string>::Err(ErrorKind::AlreadyExists,
        fmt::format("no free branch name for '{}' after {} attempts", base, UNIQUE_BRANCH_MAX_ATTEMPTS));
}

Result<std::unique_ptr<RepositoryLock>> WorktreeService::lock(StatusCallback& cb) {
    const auto& settings = config_.settings().lock;
    auto mode = settings.wait ? RepositoryLock::Mode::Block : RepositoryLock::Mode::FailFast;
    std::string path = (provider_->common_dir() / LOCK_FILE_NAME).string();

    notify(cb, "Acquiring repository lock...");
    int timeout_ms = std::min(settings.timeout_seconds,
                              std::numeric_limits<int>::max() / 1000) * 1000;
    auto held = RepositoryLock::acquire(path, mode, timeout_ms);
    if (held.is_ok() && held.value->waited()) {
        notify(cb, "Repository lock acquired after waiting for another twin process");
    }
    return held;
}

OperationReport WorktreeService::add(const AddRequest& request, StatusCallback cb) {
    fs::path path = resolve_worktree_path(request.path);
    std::string name = path.filename().string();

    // Held before the branch is chosen so a concurrent add cannot claim the
    // same generated name between the lookup and git.
    auto held = lock(cb);
    if (held.is_err()) {
        OperationReport report("add", path.string(),
                               request.new_branch.empty() ? request.branch : request.new_branch);
        report.set_error(held.kind, held.error);
        return report;
    }

    // Branch selection: -b forces a new branch, a named branch is checked
    // out (or created when missing), nothing means a generated name.
    std::string branch;
    bool create = true;
    if (!request.new_branch.empty()) {
        branch = request.new_branch;
    } else if (!request.branch.empty()) {
        branch = request.branch;
        auto exists = provider_->branch_exists(branch);
        if (exists.is_err()) {
            OperationReport report("add", path.string(), branch);
            report.set_error(exists.kind, exists.error);
            return report;
        }
        create = !exists.value;
    } else {
        auto generated = generate_branch_name(name);
        if (generated.is_err()) {
            OperationReport report("add", path.string(), "");
            report.set_error(generated.kind, generated.error);
            return report;
        }
        branch = generated.value;
    }

    OperationReport report("add", path.string(), branch);

    WorktreeContext ctx(branch, path, provider_->repo_root());
    EffectChain chain = build_effect_chain(config_.effect_plan(), *links_, options_);
    bool rollback = config_.settings().rollback_on_abort && !options_.dry_run;

    if (chain.size(LifecyclePhase::PreAdd) > 0) {
        notify(cb, fmt::format("Running pre_add ({} effects)...", chain.size(LifecyclePhase::PreAdd)));
    }
    PhaseReport pre = chain.execute(LifecyclePhase::PreAdd, ctx);
    bool pre_aborted = pre.aborted();
    report.add_phase(std::move(pre));
    if (pre_aborted) {
        if (rollback) {
            report.add_rollback_errors(chain.rollback(LifecyclePhase::PreAdd, ctx));
            report.set_rolled_back(true);
        }
        report.set_git_outcome({false, false, "skipped: pre_add aborted"});
        return report;
    }

    notify(cb, fmt::format("Creating worktree {} on {}{}...", path.string(), branch,
                           create ? " (new branch)" : ""));
    AddWorktreeOptions add_opts;
    add_opts.create_branch = create;
    auto added = provider_->add(path, branch, add_opts);
    if (added.is_err()) {
        report.set_git_outcome({true, false, added.error});
        report.set_error(ErrorKind::GitOperation, added.error);
        return report;
    }
    report.set_git_outcome({true, true, options_.dry_run
        ? fmt::format("[dry run] would create {} on {}", path.string(), branch)
        : fmt::format("created {} on {}", path.string(), branch)});

    if (chain.size(LifecyclePhase::PostAdd) > 0) {
        notify(cb, fmt::format("Running post_add ({} effects)...", chain.size(LifecyclePhase::PostAdd)));
    }
    PhaseReport post = chain.execute(LifecyclePhase::PostAdd, ctx);
    bool post_aborted = post.aborted();
    report.add_phase(std::move(post));
    if (post_aborted && rollback) {
        notify(cb, "Rolling back post_add effects...");
        report.add_rollback_errors(chain.rollback(LifecyclePhase::PostAdd, ctx));
        report.set_rolled_back(true);
    }

    twin_log(fmt::format("add {} branch={} result={} {}", path.string(), branch,
                         report.success() ? "ok" : "failed", report.summary()));
    return report;
}

OperationReport WorktreeService::remove(const RemoveRequest& request, StatusCallback cb) {
    auto found = find_worktree(request.worktree);
    if (found.is_err()) {
        OperationReport report("remove", request.worktree, "");
        report.set_error(found.kind, found.error);
        return report;
    }
    const WorktreeInfo& info = found.value;
    OperationReport report("remove", info.path, info.branch);

    if (same_path(info.path, provider_->repo_root())) {
        report.set_error(ErrorKind::InvalidArgument, "refusing to remove the main worktree");
        return report;
    }

    auto held = lock(cb);
    if (held.is_err()) {
        report.set_error(held.kind, held.error);
        return report;
    }

    WorktreeContext ctx(info.branch, info.path, provider_->repo_root());
    EffectChain chain = build_effect_chain(config_.effect_plan(), *links_, options_);

    if (chain.size(LifecyclePhase::PreRemove) > 0) {
        notify(cb, fmt::format("Running pre_remove ({} effects)...", chain.size(LifecyclePhase::PreRemove)));
    }
    PhaseReport pre = chain.execute(LifecyclePhase::PreRemove, ctx);
    bool pre_aborted = pre.aborted();
    report.add_phase(std::move(pre));
    if (pre_aborted) {
        report.set_git_outcome({false, false, "skipped: pre_remove aborted"});
        return report;
    }

    notify(cb, fmt::format("Removing worktree {}...", info.path));
    RemoveWorktreeOptions remove_opts;
    remove_opts.force = request.force;
    auto removed = provider_->remove(info.path, remove_opts);
    if (removed.is_err()) {
        report.set_git_outcome({true, false, removed.error});
        report.set_error(ErrorKind::GitOperation, removed.error);
        return report;
    }
    report.set_git_outcome({true, true, options_.dry_run
        ? fmt::format("[dry run] would remove {}", info.path)
        : fmt::format("removed {}", info.path)});

    if (chain.size(LifecyclePhase::PostRemove) > 0) {
        notify(cb, fmt::format("Running post_remove ({} effects)...", chain.size(LifecyclePhase::PostRemove)));
    }
    report.add_phase(chain.execute(LifecyclePhase::PostRemove, ctx));

    twin_log(fmt::format("remove {} result={} {}", info.path,
                         report.success() ? "ok" : "failed", report.summary()));
    return report;
}

Result<std::vector<WorktreeInfo>> WorktreeService::list() {
    return provider_->list();
}

Result<std::vector<std::string>> WorktreeService::prune(bool dry_run) {
    return provider_->prune(dry_run || options_.dry_run);
}

Result<WorktreeInfo> WorktreeService::find_worktree(const std::string& selector) {
    auto listed = provider_->list();
    if (listed.is_err()) return Result<WorktreeInfo>::Err(listed.kind, listed.error);

    fs::path as_path(selector);
    if (as_path.is_relative()) as_path = cwd_ / as_path;
    for (const auto& wt : listed.value) {
        if (same_path(wt.path, as_path)) return Result<WorktreeInfo>::Ok(wt);
    }

    std::vector<const WorktreeInfo*> matches;
    for (const auto& wt : listed.value) {
        fs::path p(wt.path);
        if (p.filename() == selector || wt.branch == selector) matches.push_back(&wt);
    }

    if (matches.size() == 1) return Result<WorktreeInfo>::Ok(*matches.front());
    if (matches.empty()) {
        return Result<WorktreeInfo>::Err(ErrorKind::NotFound,
                                         fmt::format("no worktree matches '{}'", selector));
    }
    std::string candidates;
    for (const auto* wt : matches) candidates += "\n  " + wt->path;
    return Result<WorktreeInfo>::Err(ErrorKind::InvalidArgument,
        fmt::format("'{}' matches several worktrees:{}", selector, candidates));
}

Result<WorktreeStatus> WorktreeService::status(const std::string& selector) {
    WorktreeInfo info;
    if (!selector.empty()) {
        auto found = find_worktree(selector);
        if (found.is_err()) return Result<WorktreeStatus>::Err(found.kind, found.error);
        info = found.value;
    } else {
        auto listed = provider_->list();
        if (listed.is_err()) return Result<WorktreeStatus>::Err(listed.kind, listed.error);

        fs::path here = normalized(cwd_);
        size_t best = 0;
        bool matched = false;
        for (const auto& wt : listed.value) {
            fs::path root = normalized(wt.path);
            if (path_is_within(here, root) && root.native().size() >= best) {
                best = root.native().size();
                info = wt;
                matched = true;
            }
        }
        if (!matched) {
            return Result<WorktreeStatus>::Err(ErrorKind::NotFound,
                "current directory is not inside a worktree");
        }
    }

    WorktreeContext ctx(info.branch, info.path, provider_->repo_root());
    WorktreeStatus st;
    st.worktree = info;
    st.mappings = derive_status(config_.settings().files, ctx);
    return Result<WorktreeStatus>::Ok(std::move(st));
}
