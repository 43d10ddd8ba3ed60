#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <iosfwd>
#include <core/config.hpp>
#include <tmux/tmux_client.hpp>
#include <managers/command_registry.hpp>
#include <managers/command_engine.hpp>
#include <managers/worktree_manager.hpp>
#include "resource_adapter.hpp"
#include "json.hpp"

struct ToolResult {
    std::string text;
    bool is_error = false;

    static ToolResult ok(std::string text) { return {std::move(text), false}; }
    static ToolResult fail(std::string text) { return {std::move(text), true}; }
};

// Outcome of one JSON-RPC method: a result, or an error code and message.
struct RpcOutcome {
    json result;
    int error_code = 0;
    std::string error_message;

    bool is_err() const { return error_code != 0; }

    static RpcOutcome ok(json result) { return {std::move(result), 0, ""}; }
    static RpcOutcome err(int code, std::string message) {
        return {json(), code, std::move(message)};
    }
};

// MCP server over newline-delimited JSON-RPC on a stream pair.
// Requests are handled one at a time, to completion, in arrival order.
class McpServer {
public:
    // `panes` overrides where command text is sent and captured from;
    // nullptr means the tmux client.
    explicit McpServer(Config config, PanePort* panes = nullptr);

    using ToolHandler = std::function<ToolResult(McpServer&, const json& args)>;

    void add_tool(const std::string& name, const std::string& description,
                  json input_schema, ToolHandler handler);

    // Read requests until EOF.
    void run(std::istream& in, std::ostream& out);

    // One raw line in, at most one serialized response out.
    std::optional<std::string> handle_line(const std::string& line);

    // nullopt for notifications.
    std::optional<json> handle_message(const json& msg);

    ToolResult call_tool(const std::string& name, const json& args);

    // Public state
    Config config;
    TmuxClient tmux;
    WorktreeManager worktrees;
    CommandRegistry registry;
    CommandEngine engine;
    ResourceAdapter resources;

private:
    struct ToolEntry {
        std::string description;
        json input_schema;
        ToolHandler handler;
    };
    std::map<std::string, ToolEntry> tools_;
    std::vector<std::string> tool_order_;

    RpcOutcome dispatch(const std::string& method, const json& params);
    json initialize(const json& params) const;
    json list_tools() const;
    json list_resources();
    json list_resource_templates() const;
    RpcOutcome read_resource(const json& params);
};

// Tool groups (src/mcp/tools/*.cpp)
void register_pane_tools(McpServer& server);
void register_command_tools(McpServer& server);
void register_worktree_tools(McpServer& server);
void register_agent_tools(McpServer& server);

// Worktree helpers shared by create-worktree and launch-agent-pane
json worktree_to_json(const WorktreeInfo& wt);
json worktree_options_schema();
Result<EnsureWorktreeOptions> parse_worktree_options(const json& args);

// Shell lines typed into a freshly launched agent pane
std::string build_cd_command(const std::string& path);
Result<std::string> build_export_command(const std::string& key, const std::string& value);
