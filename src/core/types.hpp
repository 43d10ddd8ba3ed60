#pragma once

#include <string>
#include <optional>
#include <utility>
#include <vector>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Child process execution result
struct ProcessResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
};

// ── tmux objects ────────────────────────────────────────────

struct TmuxSession {
    std::string id;        // "$0"
    std::string name;
    bool attached = false;
    int windows = 0;
};

struct TmuxWindow {
    std::string id;        // "@1"
    std::string name;
    bool active = false;
    std::string session_id;
};

struct TmuxPane {
    std::string id;        // "%3"
    std::string window_id;
    bool active = false;
    std::string title;
};

// ── git worktrees ───────────────────────────────────────────

struct WorktreeInfo {
    std::string path;
    std::optional<std::string> head;
    std::optional<std::string> branch;
    bool bare = false;
    bool detached = false;
    std::optional<std::string> locked;    // reason, or "locked"
    std::optional<std::string> prunable;  // reason, or "prunable"
};

struct EnsureWorktreeOptions {
    std::string repo_path;
    std::string branch_name;
    std::optional<std::string> worktree_path;
    std::optional<std::string> base_ref;
    bool create_branch = false;
    bool force = false;
};

struct EnsureWorktreeResult {
    std::string repo_path;
    std::string worktree_path;
    std::string branch;
    bool created = false;
    std::optional<WorktreeInfo> existing;
};

struct RemoveWorktreeOptions {
    std::string repo_path;
    std::string worktree_path;
    bool force = false;
};
