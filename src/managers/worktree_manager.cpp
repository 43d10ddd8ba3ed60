#include "worktree_manager.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

std::string normalize_path(const std::string& path, const std::string& base) {
    fs::path p(path);
    if (!p.is_absolute() && !base.empty()) p = fs::path(base) / p;
    std::string out = p.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// "(reason)" → "reason"; "" → fallback
static std::string unwrap_reason(std::string reason, const std::string& fallback) {
    trim(reason);
    if (!reason.empty() && reason.front() == '(') reason.erase(0, 1);
    if (!reason.empty() && reason.back() == ')') reason.pop_back();
    return reason.empty() ? fallback : reason;
}

std::vector<WorktreeInfo> parse_worktree_porcelain(const std::string& out,
                                                   const std::string& repo_root) {
    std::vector<WorktreeInfo> worktrees;
    std::optional<WorktreeInfo> current;

    std::istringstream ss(out);
    std::string line;
    while (std::getline(ss, line)) {
        trim(line);

        if (line.empty()) {
            if (current) {
                worktrees.push_back(*current);
                current.reset();
            }
            continue;
        }

        if (starts_with(line, "worktree ")) {
            if (current) worktrees.push_back(*current);
            std::string path = line.substr(9);
            trim(path);
            current = WorktreeInfo{};
            current->path = normalize_path(path, repo_root);
            continue;
        }

        if (!current) continue;

        if (starts_with(line, "HEAD ")) {
            std::string head = line.substr(5);
            trim(head);
            current->head = head;
        } else if (starts_with(line, "branch ")) {
            std::string branch = line.substr(7);
            trim(branch);
            if (starts_with(branch, "refs/heads/")) branch = branch.substr(11);
            current->branch = branch;
        } else if (line == "bare") {
            current->bare = true;
        } else if (line == "detached") {
            current->detached = true;
        } else if (starts_with(line, "locked")) {
            current->locked = unwrap_reason(line.substr(6), "locked");
        } else if (starts_with(line, "prunable")) {
            current->prunable = unwrap_reason(line.substr(8), "prunable");
        }
    }

    if (current) worktrees.push_back(*current);
    return worktrees;
}

std::vector<std::string> worktree_add_args(const EnsureWorktreeOptions& opts,
                                           const std::string& path) {
    std::vector<std::string> args = {"worktree", "add"};
    if (opts.force) args.push_back("--force");
    if (opts.create_branch) {
        args.push_back("-b");
        args.push_back(opts.branch_name);
    }
    args.push_back(path);
    if (opts.create_branch && opts.base_ref) {
        args.push_back(*opts.base_ref);
    } else if (!opts.create_branch) {
        args.push_back(opts.branch_name);
    }
    return args;
}

// ── WorktreeManager ──────────────────────────────────────────

WorktreeManager::WorktreeManager(std::string git_binary) : git_(std::move(git_binary)) {}

Result<std::string> WorktreeManager::run_git(const std::string& repo_path,
                                             const std::vector<std::string>& args) {
    std::vector<std::string> full = {"-C", repo_path};
    full.insert(full.end(), args.begin(), args.end());

    ProcessResult r = platform::run_process(git_, full);
    if (r.success()) return Result<std::string>::Ok(r.stdout_data);

    mcp_log_process("git", platform::describe_command(git_, full), r);

    std::string joined;
    for (const auto& a : args) joined += (joined.empty() ? "" : " ") + a;
    std::string message = r.stderr_data;
    trim(message);
    if (message.empty()) message = fmt::format("exit code {}", r.exit_code);
    return Result<std::string>::Err(fmt::format("git {} failed: {}", joined, message));
}

Result<std::string> WorktreeManager::resolve_repo_root(const std::string& repo_path) {
    auto r = run_git(normalize_path(repo_path), {"rev-parse", "--show-toplevel"});
    if (r.is_err()) return r;
    std::string root = r.value;
    trim(root);
    return Result<std::string>::Ok(normalize_path(root));
}

Result<std::vector<WorktreeInfo>> WorktreeManager::list(const std::string& repo_path) {
    auto root = resolve_repo_root(repo_path);
    if (root.is_err()) return Result<std::vector<WorktreeInfo>>::Err(root.error);

    auto r = run_git(root.value, {"worktree", "list", "--porcelain"});
    if (r.is_err()) return Result<std::vector<WorktreeInfo>>::Err(r.error);
    return Result<std::vector<WorktreeInfo>>::Ok(parse_worktree_porcelain(r.value, root.value));
}

Result<EnsureWorktreeResult> WorktreeManager::ensure(const EnsureWorktreeOptions& opts) {
    using R = Result<EnsureWorktreeResult>;

    std::string branch = opts.branch_name;
    trim(branch);
    if (branch.empty()) return R::Err("branchName is required");
    if (!opts.create_branch && opts.base_ref) {
        return R::Err("baseRef can only be used when createBranch is true");
    }

    auto root = resolve_repo_root(opts.repo_path);
    if (root.is_err()) return R::Err(root.error);

    std::string target = opts.worktree_path
        ? normalize_path(*opts.worktree_path, root.value)
        : normalize_path("../" + opts.branch_name, root.value);

    auto worktrees = list(root.value);
    if (worktrees.is_err()) return R::Err(worktrees.error);

    EnsureWorktreeResult result;
    result.repo_path = root.value;
    result.worktree_path = target;
    result.branch = opts.branch_name;

    for (const auto& wt : worktrees.value) {
        if (wt.path == target) {
            result.branch = wt.branch.value_or(opts.branch_name);
            result.created = false;
            result.existing = wt;
            return R::Ok(result);
        }
    }

    for (const auto& wt : worktrees.value) {
        if (wt.branch && *wt.branch == opts.branch_name && !opts.force) {
            return R::Err(fmt::format(
                "Branch {} is already checked out at {}. Use force=true to reuse the "
                "branch or choose a different branch name.", opts.branch_name, wt.path));
        }
    }

    auto add = run_git(root.value, worktree_add_args(opts, target));
    if (add.is_err()) return R::Err(add.error);

    mcp_log(fmt::format("worktree: created {} ({})", target, opts.branch_name));
    result.created = true;
    return R::Ok(result);
}

Result<void> WorktreeManager::remove(const RemoveWorktreeOptions& opts) {
    auto root = resolve_repo_root(opts.repo_path);
    if (root.is_err()) return Result<void>::Err(root.error);

    std::vector<std::string> args = {"worktree", "remove"};
    if (opts.force) args.push_back("--force");
    args.push_back(normalize_path(opts.worktree_path, root.value));

    auto r = run_git(root.value, args);
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}
