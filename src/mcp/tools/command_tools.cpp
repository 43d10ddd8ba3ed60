#include "../server.hpp"
#include "../tool_args.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

static ToolResult do_execute_command(McpServer& server, const json& args) {
    auto pane_id = require_string(args, "paneId");
    if (pane_id.is_err()) return ToolResult::fail(pane_id.error);
    auto command = require_string(args, "command");
    if (command.is_err()) return ToolResult::fail(command.error);
    auto raw_mode = optional_bool(args, "rawMode");
    if (raw_mode.is_err()) return ToolResult::fail(raw_mode.error);
    auto no_enter = optional_bool(args, "noEnter");
    if (no_enter.is_err()) return ToolResult::fail(no_enter.error);

    bool keys_only = no_enter.value.value_or(false);
    bool raw = keys_only || raw_mode.value.value_or(false);

    auto id = server.engine.execute(pane_id.value, command.value, raw, keys_only);
    if (id.is_err()) return ToolResult::fail("Error executing command: " + id.error);

    if (raw) {
        return ToolResult::ok(fmt::format(
            "{}.\n\nStatus tracking is disabled.\n"
            "Use 'capture-pane' with paneId '{}' to verify the command outcome.\n\n"
            "Command ID: {}",
            keys_only ? "Keys sent without Enter" : "Interactive command started (rawMode)",
            pane_id.value, id.value));
    }

    return ToolResult::ok(fmt::format(
        "Command execution started.\n\n"
        "To get results, subscribe to and read resource: {}\n\n"
        "Status will change from 'pending' to 'completed' or 'error' when finished.\n\n"
        "Command ID: {}",
        fmt::format(COMMAND_RESULT_URI, id.value), id.value));
}

static ToolResult do_get_command_result(McpServer& server, const json& args) {
    auto command_id = require_string(args, "commandId");
    if (command_id.is_err()) return ToolResult::fail(command_id.error);

    auto status = server.engine.check_status(command_id.value);
    if (status.is_err()) {
        return ToolResult::fail("Error retrieving command result: " + status.error);
    }
    if (!status.value) {
        return ToolResult::fail("Command not found: " + command_id.value);
    }
    return ToolResult::ok(render_command(*status.value));
}

void register_command_tools(McpServer& server) {
    server.add_tool(
        "execute-command",
        "Execute a command in a tmux pane and get results. For interactive applications "
        "(REPLs, editors), use `rawMode=true`. IMPORTANT: When `rawMode=false` (default), "
        "avoid heredoc syntax (cat << EOF) and other multi-line constructs as they conflict "
        "with command wrapping. For file writing, prefer: printf 'content\\n' > file, echo "
        "statements, or write to temp files instead. Only one tracked command may run in a "
        "pane at a time.",
        object_schema({
            {"paneId", prop("string", "ID of the tmux pane")},
            {"command", prop("string", "Command to execute")},
            {"rawMode", prop("boolean",
                             "Execute command without wrapper markers for REPL/interactive "
                             "compatibility. Disables get-command-result status tracking. "
                             "Use capture-pane after execution to verify command outcome.")},
            {"noEnter", prop("boolean",
                             "Send keystrokes without pressing Enter. For TUI navigation in "
                             "apps like btop, vim, less. Supports special keys (Up, Down, "
                             "Escape, Tab, C-c, etc.) and strings (sent char-by-char for "
                             "proper filtering). Automatically applies rawMode. Use "
                             "capture-pane after to see results.")},
        }, {"paneId", "command"}),
        do_execute_command);

    server.add_tool(
        "get-command-result", "Get the result of an executed command",
        object_schema({{"commandId", prop("string", "ID of the executed command")}},
                      {"commandId"}),
        do_get_command_result);
}
