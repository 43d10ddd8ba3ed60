#include "../server.hpp"
#include "../tool_args.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <regex>

static bool valid_env_name(const std::string& key) {
    static const std::regex kName("^[A-Za-z_][A-Za-z0-9_]*$");
    return std::regex_match(key, kName);
}

Result<std::string> build_export_command(const std::string& key, const std::string& value) {
    if (!valid_env_name(key)) {
        return Result<std::string>::Err("Invalid environment variable name: " + key);
    }
    return Result<std::string>::Ok(fmt::format("export {}={}", key, shell_double_quote(value)));
}

std::string build_cd_command(const std::string& path) {
    return "cd " + shell_double_quote(path);
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static ToolResult do_launch_agent_pane(McpServer& server, const json& args) {
    auto target_pane = optional_string(args, "targetPaneId");
    auto target = optional_string(args, "target");
    auto direction_arg = optional_string(args, "direction");
    auto size = optional_int(args, "size");
    auto agent = optional_string(args, "agent");
    auto agent_command = optional_string(args, "agentCommand");
    auto working_dir = optional_string(args, "workingDirectory");
    auto pane_title = optional_string(args, "paneTitle");
    auto focus = optional_bool(args, "focus");
    auto environment = optional_string_map(args, "environment");
    auto initial_message = optional_string(args, "initialMessage");
    auto delay = optional_int(args, "initialMessageDelayMs");

    for (const std::string* err : {&target_pane.error, &target.error, &direction_arg.error,
                                   &size.error, &agent.error, &agent_command.error,
                                   &working_dir.error, &pane_title.error, &focus.error,
                                   &environment.error, &initial_message.error, &delay.error}) {
        if (!err->empty()) return ToolResult::fail("Error launching agent pane: " + *err);
    }

    std::optional<EnsureWorktreeOptions> worktree_opts;
    if (args.contains("worktree") && !args["worktree"].is_null()) {
        if (!args["worktree"].is_object()) {
            return ToolResult::fail("Error launching agent pane: 'worktree' must be an object");
        }
        auto parsed = parse_worktree_options(args["worktree"]);
        if (parsed.is_err()) return ToolResult::fail("Error launching agent pane: " + parsed.error);
        worktree_opts = parsed.value;
    }

    std::optional<std::string> preset_command;
    if (agent.value) {
        preset_command = server.config.agent_command(*agent.value);
        if (!preset_command) {
            return ToolResult::fail("Error launching agent pane: unknown agent preset " + *agent.value);
        }
    }

    auto fail = [](const std::string& msg) {
        return ToolResult::fail("Error launching agent pane: " + msg);
    };

    std::string direction = direction_arg.value.value_or("vertical");
    std::string source_pane;
    if (target_pane.value) {
        source_pane = *target_pane.value;
    } else {
        auto active = server.tmux.active_pane_id(target.value.value_or(""));
        if (active.is_err()) return fail(active.error);
        source_pane = active.value;
    }

    auto split = server.tmux.split_pane(source_pane, direction, size.value);
    if (split.is_err()) return fail(split.error);
    if (!split.value) return fail("Failed to create a new pane from target " + source_pane);

    const std::string new_pane = split.value->id;
    std::vector<std::string> operations;
    operations.push_back(fmt::format("Split pane {} -> {} ({}{})", source_pane, new_pane, direction,
                                     size.value ? fmt::format(", size {}%", *size.value) : ""));

    if (focus.value.value_or(true)) {
        auto r = server.tmux.select_pane(new_pane);
        if (r.is_err()) return fail(r.error);
        operations.push_back("Focused new pane");
    }

    std::optional<std::string> title = pane_title.value;
    if (!title && agent.value) title = "Agent | " + upper(*agent.value);
    if (title) {
        auto r = server.tmux.rename_pane(new_pane, *title);
        if (r.is_err()) return fail(r.error);
        operations.push_back(fmt::format("Set pane title to \"{}\"", *title));
    }

    std::optional<std::string> cwd = working_dir.value;
    if (worktree_opts) {
        auto wt = server.worktrees.ensure(*worktree_opts);
        if (wt.is_err()) return fail(wt.error);
        if (!cwd) cwd = wt.value.worktree_path;

        if (wt.value.created) {
            operations.push_back(fmt::format("Created worktree at {} (branch {})",
                                             wt.value.worktree_path, wt.value.branch));
        } else if (wt.value.existing) {
            operations.push_back(fmt::format(
                "Reused existing worktree at {} (branch {})", wt.value.worktree_path,
                wt.value.existing->branch.value_or(wt.value.branch)));
        }
    }

    if (cwd) {
        auto r = server.tmux.send_text(new_pane, build_cd_command(*cwd));
        if (r.is_err()) return fail(r.error);
        operations.push_back("Changed directory to " + *cwd);
    }

    for (const auto& [key, value] : environment.value) {
        auto cmd = build_export_command(key, value);
        if (cmd.is_err()) return fail(cmd.error);
        auto r = server.tmux.send_text(new_pane, cmd.value);
        if (r.is_err()) return fail(r.error);
        operations.push_back("Exported " + key);
    }

    std::optional<std::string> launch = agent_command.value ? agent_command.value : preset_command;
    if (launch) {
        auto r = server.tmux.send_text(new_pane, *launch);
        if (r.is_err()) return fail(r.error);
        operations.push_back("Started command: " + *launch);
    } else {
        operations.push_back("No launch command supplied; pane left idle.");
    }

    if (initial_message.value) {
        platform::sleep_ms(delay.value.value_or(server.config.initial_message_delay_ms()));
        auto r = server.tmux.send_text(new_pane, *initial_message.value);
        if (r.is_err()) return fail(r.error);
        operations.push_back("Posted initial message to agent CLI");
    }

    mcp_log(fmt::format("launch-agent-pane: {} ready ({} steps)", new_pane, operations.size()));

    std::string text = fmt::format("New pane {} ready.", new_pane);
    for (const auto& op : operations) text += "\n- " + op;
    return ToolResult::ok(text);
}

void register_agent_tools(McpServer& server) {
    json direction = prop("string", "Split direction. Defaults to 'vertical' (top/bottom).");
    direction["enum"] = {"horizontal", "vertical"};
    json size = prop("number", "Size of the new pane as a percentage (1-99).");
    size["minimum"] = 1;
    size["maximum"] = 99;

    json agent = prop("string", "Preset agent CLI to launch.");
    json presets = json::array();
    for (const auto& kv : server.config.agents()) presets.push_back(kv.first);
    agent["enum"] = presets;

    json environment = prop("object", "Environment variables to export before launching the agent.");
    environment["additionalProperties"] = {{"type", "string"}};

    json delay = prop("number", "Delay in milliseconds before sending initialMessage. "
                                "Defaults to 500.");
    delay["minimum"] = 0;

    json worktree = object_schema(worktree_options_schema(), {"repoPath", "branchName"});
    worktree["description"] = "Optional git worktree configuration.";

    server.add_tool(
        "launch-agent-pane",
        "Split a tmux pane and launch an AI coding agent CLI (Codex, ClaudeCode, Gemini, ...) "
        "in it. Steps: 1) resolve the active pane from `target` when targetPaneId is omitted; "
        "2) split in the given direction, focus and title the new pane; 3) ensure the git "
        "worktree when worktree options are given, reusing an existing one; 4) apply "
        "workingDirectory and environment inside the pane; 5) run agentCommand or the agent "
        "preset and optionally post initialMessage. Check progress afterwards with "
        "capture-pane / list-panes and call kill-pane when the task is done.",
        object_schema({
            {"targetPaneId", prop("string", "Existing pane ID to split. If omitted, the active "
                                            "pane is used.")},
            {"target", prop("string", "tmux target (session[:window[.pane]]) used to resolve "
                                      "the active pane when targetPaneId is not provided.")},
            {"direction", direction},
            {"size", size},
            {"agent", agent},
            {"agentCommand", prop("string", "Explicit command to run in the new pane. Overrides "
                                            "the agent preset.")},
            {"workingDirectory", prop("string", "Directory to cd into before launching the "
                                                "agent. Defaults to the worktree path when "
                                                "worktree options are provided.")},
            {"paneTitle", prop("string", "Optional pane title to apply after creation.")},
            {"focus", prop("boolean", "Focus the new pane after creation. Defaults to true.")},
            {"environment", environment},
            {"initialMessage", prop("string", "Optional instruction to send to the agent CLI "
                                              "after it starts.")},
            {"initialMessageDelayMs", delay},
            {"worktree", worktree},
        }),
        do_launch_agent_pane);
}
