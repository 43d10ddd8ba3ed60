#include "../server.hpp"
#include "../tool_args.hpp"
#include <fmt/format.h>

json worktree_to_json(const WorktreeInfo& wt) {
    json j = {{"path", wt.path}};
    if (wt.head) j["head"] = *wt.head;
    if (wt.branch) j["branch"] = *wt.branch;
    if (wt.bare) j["bare"] = true;
    if (wt.detached) j["detached"] = true;
    if (wt.locked) j["locked"] = *wt.locked;
    if (wt.prunable) j["prunable"] = *wt.prunable;
    return j;
}

// Shared by create-worktree and launch-agent-pane.
Result<EnsureWorktreeOptions> parse_worktree_options(const json& args) {
    using R = Result<EnsureWorktreeOptions>;
    EnsureWorktreeOptions opts;

    auto repo = require_string(args, "repoPath");
    if (repo.is_err()) return R::Err(repo.error);
    auto branch = require_string(args, "branchName");
    if (branch.is_err()) return R::Err(branch.error);
    auto path = optional_string(args, "worktreePath");
    if (path.is_err()) return R::Err(path.error);
    auto base = optional_string(args, "baseRef");
    if (base.is_err()) return R::Err(base.error);
    auto create = optional_bool(args, "createBranch");
    if (create.is_err()) return R::Err(create.error);
    auto force = optional_bool(args, "force");
    if (force.is_err()) return R::Err(force.error);

    opts.repo_path = repo.value;
    opts.branch_name = branch.value;
    opts.worktree_path = path.value;
    opts.base_ref = base.value;
    opts.create_branch = create.value.value_or(false);
    opts.force = force.value.value_or(false);
    return R::Ok(opts);
}

static ToolResult do_list_worktrees(McpServer& server, const json& args) {
    auto repo = require_string(args, "repoPath");
    if (repo.is_err()) return ToolResult::fail(repo.error);

    auto list = server.worktrees.list(repo.value);
    if (list.is_err()) return ToolResult::fail("Error listing worktrees: " + list.error);

    json arr = json::array();
    for (const auto& wt : list.value) arr.push_back(worktree_to_json(wt));
    return ToolResult::ok(arr.dump(2));
}

static ToolResult do_create_worktree(McpServer& server, const json& args) {
    auto opts = parse_worktree_options(args);
    if (opts.is_err()) return ToolResult::fail(opts.error);

    auto r = server.worktrees.ensure(opts.value);
    if (r.is_err()) return ToolResult::fail("Error creating worktree: " + r.error);

    json details = {
        {"repoPath", r.value.repo_path},
        {"worktreePath", r.value.worktree_path},
        {"branch", r.value.branch},
        {"created", r.value.created},
    };
    if (r.value.existing) details["existingWorktree"] = worktree_to_json(*r.value.existing);

    std::string status = r.value.created
        ? "Created worktree at " + r.value.worktree_path
        : "Worktree already exists at " + r.value.worktree_path;
    return ToolResult::ok(fmt::format("{}\n\n{}", status, details.dump(2)));
}

static ToolResult do_remove_worktree(McpServer& server, const json& args) {
    auto repo = require_string(args, "repoPath");
    if (repo.is_err()) return ToolResult::fail(repo.error);
    auto path = require_string(args, "worktreePath");
    if (path.is_err()) return ToolResult::fail(path.error);
    auto force = optional_bool(args, "force");
    if (force.is_err()) return ToolResult::fail(force.error);

    RemoveWorktreeOptions opts;
    opts.repo_path = repo.value;
    opts.worktree_path = path.value;
    opts.force = force.value.value_or(false);

    auto r = server.worktrees.remove(opts);
    if (r.is_err()) return ToolResult::fail("Error removing worktree: " + r.error);
    return ToolResult::ok("Removed worktree at " + path.value);
}

json worktree_options_schema() {
    return {
        {"repoPath", prop("string", "Path inside the git repository.")},
        {"branchName", prop("string", "Branch name for the worktree.")},
        {"worktreePath", prop("string", "Directory for the worktree. Relative paths resolve "
                                        "from the repo root.")},
        {"baseRef", prop("string", "Starting point when creating a new branch (requires "
                                   "createBranch=true).")},
        {"createBranch", prop("boolean", "Create a new branch for the worktree. Defaults to "
                                         "false.")},
        {"force", prop("boolean", "Force worktree creation even if the branch is checked out "
                                  "elsewhere.")},
    };
}

void register_worktree_tools(McpServer& server) {
    server.add_tool("list-worktrees", "List git worktrees for a repository path.",
                    object_schema({{"repoPath", prop("string", "Path inside the git repository.")}},
                                  {"repoPath"}),
                    do_list_worktrees);

    server.add_tool("create-worktree", "Create (or reuse) a git worktree for the specified branch.",
                    object_schema(worktree_options_schema(), {"repoPath", "branchName"}),
                    do_create_worktree);

    server.add_tool("remove-worktree", "Remove a git worktree directory.",
                    object_schema({
                        {"repoPath", prop("string", "Path inside the git repository.")},
                        {"worktreePath", prop("string", "Worktree directory to remove.")},
                        {"force", prop("boolean", "Force removal (cleans even if worktree has "
                                                  "changes).")},
                    }, {"repoPath", "worktreePath"}),
                    do_remove_worktree);
}
