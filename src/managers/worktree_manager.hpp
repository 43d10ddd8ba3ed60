#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Git worktree lifecycle, driven through the git CLI (`git -C <repo> ...`).
class WorktreeManager {
public:
    explicit WorktreeManager(std::string git_binary = "git");

    Result<std::vector<WorktreeInfo>> list(const std::string& repo_path);

    // Reuse the worktree already at the target path, or create it.
    Result<EnsureWorktreeResult> ensure(const EnsureWorktreeOptions& opts);

    Result<void> remove(const RemoveWorktreeOptions& opts);

private:
    std::string git_;

    Result<std::string> run_git(const std::string& repo_path,
                                const std::vector<std::string>& args);
    Result<std::string> resolve_repo_root(const std::string& repo_path);
};

// Parse `git worktree list --porcelain`; relative paths resolve against repo_root.
std::vector<WorktreeInfo> parse_worktree_porcelain(const std::string& out,
                                                   const std::string& repo_root);

// Absolute, normalized path with no trailing separator.
std::string normalize_path(const std::string& path, const std::string& base = "");

// Arguments after `git -C <root>` for creating a worktree at `path`.
std::vector<std::string> worktree_add_args(const EnsureWorktreeOptions& opts,
                                           const std::string& path);
