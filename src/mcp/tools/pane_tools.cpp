#include "../server.hpp"
#include "../tool_args.hpp"
#include <fmt/format.h>

// ── Handlers ─────────────────────────────────────────────────

static ToolResult do_list_sessions(McpServer& server, const json&) {
    auto sessions = server.tmux.list_sessions();
    if (sessions.is_err()) {
        return ToolResult::fail("Error listing tmux sessions: " + sessions.error);
    }
    return ToolResult::ok(sessions_to_json(sessions.value).dump(2));
}

static ToolResult do_find_session(McpServer& server, const json& args) {
    auto name = require_string(args, "name");
    if (name.is_err()) return ToolResult::fail(name.error);

    auto session = server.tmux.find_session(name.value);
    if (session.is_err()) return ToolResult::fail("Error finding tmux session: " + session.error);
    if (!session.value) return ToolResult::ok("Session not found: " + name.value);
    return ToolResult::ok(sessions_to_json({*session.value})[0].dump(2));
}

static ToolResult do_list_windows(McpServer& server, const json& args) {
    auto session_id = require_string(args, "sessionId");
    if (session_id.is_err()) return ToolResult::fail(session_id.error);

    auto windows = server.tmux.list_windows(session_id.value);
    if (windows.is_err()) return ToolResult::fail("Error listing windows: " + windows.error);
    return ToolResult::ok(windows_to_json(windows.value).dump(2));
}

static ToolResult do_list_panes(McpServer& server, const json& args) {
    auto window_id = require_string(args, "windowId");
    if (window_id.is_err()) return ToolResult::fail(window_id.error);

    auto panes = server.tmux.list_panes(window_id.value);
    if (panes.is_err()) return ToolResult::fail("Error listing panes: " + panes.error);
    return ToolResult::ok(panes_to_json(panes.value).dump(2));
}

static ToolResult do_capture_pane(McpServer& server, const json& args) {
    auto pane_id = require_string(args, "paneId");
    if (pane_id.is_err()) return ToolResult::fail(pane_id.error);
    auto lines = optional_int(args, "lines");
    if (lines.is_err()) return ToolResult::fail(lines.error);
    auto colors = optional_bool(args, "colors");
    if (colors.is_err()) return ToolResult::fail(colors.error);

    int count = lines.value.value_or(server.config.resource_capture_lines());
    auto content = server.tmux.capture(pane_id.value, count, colors.value.value_or(false));
    if (content.is_err()) return ToolResult::fail("Error capturing pane content: " + content.error);
    return ToolResult::ok(content.value.empty() ? "No content captured" : content.value);
}

static ToolResult do_create_session(McpServer& server, const json& args) {
    auto name = require_string(args, "name");
    if (name.is_err()) return ToolResult::fail(name.error);

    auto session = server.tmux.create_session(name.value);
    if (session.is_err()) return ToolResult::fail("Error creating session: " + session.error);
    if (!session.value) return ToolResult::ok("Failed to create session: " + name.value);
    return ToolResult::ok("Session created: " + sessions_to_json({*session.value})[0].dump(2));
}

static ToolResult do_create_window(McpServer& server, const json& args) {
    auto session_id = require_string(args, "sessionId");
    if (session_id.is_err()) return ToolResult::fail(session_id.error);
    auto name = require_string(args, "name");
    if (name.is_err()) return ToolResult::fail(name.error);

    auto window = server.tmux.create_window(session_id.value, name.value);
    if (window.is_err()) return ToolResult::fail("Error creating window: " + window.error);
    if (!window.value) return ToolResult::ok("Failed to create window: " + name.value);
    return ToolResult::ok("Window created: " + windows_to_json({*window.value})[0].dump(2));
}

static ToolResult do_kill_session(McpServer& server, const json& args) {
    auto id = require_string(args, "sessionId");
    if (id.is_err()) return ToolResult::fail(id.error);
    auto r = server.tmux.kill_session(id.value);
    if (r.is_err()) return ToolResult::fail("Error killing session: " + r.error);
    return ToolResult::ok(fmt::format("Session {} has been killed", id.value));
}

static ToolResult do_kill_window(McpServer& server, const json& args) {
    auto id = require_string(args, "windowId");
    if (id.is_err()) return ToolResult::fail(id.error);
    auto r = server.tmux.kill_window(id.value);
    if (r.is_err()) return ToolResult::fail("Error killing window: " + r.error);
    return ToolResult::ok(fmt::format("Window {} has been killed", id.value));
}

static ToolResult do_kill_pane(McpServer& server, const json& args) {
    auto id = require_string(args, "paneId");
    if (id.is_err()) return ToolResult::fail(id.error);
    auto r = server.tmux.kill_pane(id.value);
    if (r.is_err()) return ToolResult::fail("Error killing pane: " + r.error);
    return ToolResult::ok(fmt::format("Pane {} has been killed", id.value));
}

static ToolResult do_split_pane(McpServer& server, const json& args) {
    auto pane_id = require_string(args, "paneId");
    if (pane_id.is_err()) return ToolResult::fail(pane_id.error);
    auto direction = optional_string(args, "direction");
    if (direction.is_err()) return ToolResult::fail(direction.error);
    auto size = optional_int(args, "size");
    if (size.is_err()) return ToolResult::fail(size.error);

    auto pane = server.tmux.split_pane(pane_id.value, direction.value.value_or("vertical"),
                                       size.value);
    if (pane.is_err()) return ToolResult::fail("Error splitting pane: " + pane.error);
    if (!pane.value) return ToolResult::ok("Failed to split pane " + pane_id.value);
    return ToolResult::ok("Pane split successfully. New pane: " +
                          panes_to_json({*pane.value})[0].dump(2));
}

// ── Registration ─────────────────────────────────────────────

void register_pane_tools(McpServer& server) {
    server.add_tool("list-sessions", "List all active tmux sessions",
                    object_schema(json::object()), do_list_sessions);

    server.add_tool("find-session", "Find a tmux session by name",
                    object_schema({{"name", prop("string", "Name of the tmux session to find")}},
                                  {"name"}),
                    do_find_session);

    server.add_tool("list-windows", "List windows in a tmux session",
                    object_schema({{"sessionId", prop("string", "ID of the tmux session")}},
                                  {"sessionId"}),
                    do_list_windows);

    server.add_tool("list-panes", "List panes in a tmux window",
                    object_schema({{"windowId", prop("string", "ID of the tmux window")}},
                                  {"windowId"}),
                    do_list_panes);

    server.add_tool("capture-pane",
                    "Capture content from a tmux pane with configurable lines count and "
                    "optional color preservation",
                    object_schema({
                        {"paneId", prop("string", "ID of the tmux pane")},
                        {"lines", prop("string", "Number of lines to capture")},
                        {"colors", prop("boolean", "Include color/escape sequences for text "
                                                   "and background attributes in output")},
                    }, {"paneId"}),
                    do_capture_pane);

    server.add_tool("create-session", "Create a new tmux session",
                    object_schema({{"name", prop("string", "Name for the new tmux session")}},
                                  {"name"}),
                    do_create_session);

    server.add_tool("create-window", "Create a new window in a tmux session",
                    object_schema({
                        {"sessionId", prop("string", "ID of the tmux session")},
                        {"name", prop("string", "Name for the new window")},
                    }, {"sessionId", "name"}),
                    do_create_window);

    server.add_tool("kill-session", "Kill a tmux session by ID",
                    object_schema({{"sessionId", prop("string", "ID of the tmux session to kill")}},
                                  {"sessionId"}),
                    do_kill_session);

    server.add_tool("kill-window", "Kill a tmux window by ID",
                    object_schema({{"windowId", prop("string", "ID of the tmux window to kill")}},
                                  {"windowId"}),
                    do_kill_window);

    server.add_tool("kill-pane", "Kill a tmux pane by ID",
                    object_schema({{"paneId", prop("string", "ID of the tmux pane to kill")}},
                                  {"paneId"}),
                    do_kill_pane);

    json direction = prop("string", "Split direction: 'horizontal' (side by side) or "
                                    "'vertical' (top/bottom). Default is 'vertical'");
    direction["enum"] = {"horizontal", "vertical"};
    json size = prop("number", "Size of the new pane as percentage (1-99). Default is 50%");
    size["minimum"] = 1;
    size["maximum"] = 99;
    server.add_tool("split-pane", "Split a tmux pane horizontally or vertically",
                    object_schema({
                        {"paneId", prop("string", "ID of the tmux pane to split")},
                        {"direction", direction},
                        {"size", size},
                    }, {"paneId"}),
                    do_split_pane);
}
