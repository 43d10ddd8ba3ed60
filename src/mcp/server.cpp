#include "server.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <iostream>

static EngineOptions engine_options(const Config& config) {
    EngineOptions opts;
    opts.shell = config.shell();
    opts.capture_lines = config.capture_lines();
    opts.lost_after = std::chrono::seconds(config.lost_after_seconds());
    return opts;
}

McpServer::McpServer(Config cfg, PanePort* panes)
    : config(std::move(cfg)),
      tmux(config.tmux_binary()),
      worktrees(config.git_binary()),
      registry(),
      engine(registry, panes ? *panes : static_cast<PanePort&>(tmux), engine_options(config)),
      resources(engine, registry, tmux, config) {
    register_pane_tools(*this);
    register_command_tools(*this);
    register_worktree_tools(*this);
    register_agent_tools(*this);
}

void McpServer::add_tool(const std::string& name, const std::string& description,
                         json input_schema, ToolHandler handler) {
    if (!tools_.count(name)) tool_order_.push_back(name);
    tools_[name] = {description, std::move(input_schema), std::move(handler)};
}

// ── Transport ────────────────────────────────────────────────

void McpServer::run(std::istream& in, std::ostream& out) {
    mcp_log(fmt::format("{} {} ready (shell={})", SERVER_NAME, SERVER_VERSION,
                        shell_name(config.shell())));
    std::string line;
    while (std::getline(in, line)) {
        auto response = handle_line(line);
        if (response) {
            out << *response << "\n" << std::flush;
        }
    }
    mcp_log("stdin closed, shutting down");
}

static json error_response(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

std::optional<std::string> McpServer::handle_line(const std::string& line) {
    auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;

    json msg = json::parse(line, nullptr, false);
    if (msg.is_discarded()) {
        mcp_log("protocol: unparseable line: " + line.substr(0, 200));
        return error_response(nullptr, RPC_PARSE_ERROR, "Parse error").dump();
    }

    if (msg.is_array()) {
        if (msg.empty()) {
            return error_response(nullptr, RPC_INVALID_REQUEST, "Empty batch").dump();
        }
        json responses = json::array();
        for (const auto& m : msg) {
            auto r = handle_message(m);
            if (r) responses.push_back(*r);
        }
        if (responses.empty()) return std::nullopt;
        return responses.dump();
    }

    auto response = handle_message(msg);
    if (!response) return std::nullopt;
    return response->dump();
}

std::optional<json> McpServer::handle_message(const json& msg) {
    if (!msg.is_object()) {
        return error_response(nullptr, RPC_INVALID_REQUEST, "Request must be an object");
    }

    bool has_id = msg.contains("id");
    json id = has_id ? msg["id"] : json(nullptr);

    if (!msg.contains("method")) {
        // A response to something we never send; nothing to answer.
        if (msg.contains("result") || msg.contains("error")) return std::nullopt;
        return error_response(id, RPC_INVALID_REQUEST, "Missing method");
    }
    if (!msg["method"].is_string()) {
        return error_response(id, RPC_INVALID_REQUEST, "Method must be a string");
    }

    std::string method = msg["method"].get<std::string>();
    json params = msg.contains("params") ? msg["params"] : json::object();
    if (params.is_null()) params = json::object();

    RpcOutcome outcome;
    try {
        outcome = dispatch(method, params);
    } catch (const json::exception& e) {
        outcome = RpcOutcome::err(RPC_INVALID_PARAMS, e.what());
    } catch (const std::exception& e) {
        mcp_log(fmt::format("protocol: {} failed: {}", method, e.what()));
        outcome = RpcOutcome::err(RPC_INTERNAL_ERROR, e.what());
    }

    if (!has_id) return std::nullopt;

    if (outcome.is_err()) {
        return error_response(id, outcome.error_code, outcome.error_message);
    }
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", outcome.result}};
}

// ── Methods ──────────────────────────────────────────────────

RpcOutcome McpServer::dispatch(const std::string& method, const json& params) {
    if (method == "initialize") return RpcOutcome::ok(initialize(params));
    if (method == "ping") return RpcOutcome::ok(json::object());
    if (method == "tools/list") return RpcOutcome::ok(list_tools());
    if (method == "resources/list") return RpcOutcome::ok(list_resources());
    if (method == "resources/templates/list") return RpcOutcome::ok(list_resource_templates());
    if (method == "resources/read") return read_resource(params);

    if (method == "tools/call") {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return RpcOutcome::err(RPC_INVALID_PARAMS, "tools/call requires a tool name");
        }
        std::string name = params["name"].get<std::string>();
        if (!tools_.count(name)) {
            return RpcOutcome::err(RPC_INVALID_PARAMS, fmt::format("Tool {} not found", name));
        }
        json args = params.contains("arguments") && params["arguments"].is_object()
                        ? params["arguments"] : json::object();
        ToolResult r = call_tool(name, args);
        json content = json::array();
        content.push_back({{"type", "text"}, {"text", r.text}});
        json result = {{"content", content}};
        if (r.is_error) result["isError"] = true;
        return RpcOutcome::ok(result);
    }

    if (method == "resources/subscribe" || method == "resources/unsubscribe") {
        if (!params.contains("uri") || !params["uri"].is_string()) {
            return RpcOutcome::err(RPC_INVALID_PARAMS, "uri is required");
        }
        return RpcOutcome::ok(json::object());
    }

    if (method == "logging/setLevel") {
        if (params.contains("level") && params["level"].is_string()) {
            mcp_log("protocol: client requested log level " + params["level"].get<std::string>());
        }
        return RpcOutcome::ok(json::object());
    }

    if (method.compare(0, 14, "notifications/") == 0) {
        return RpcOutcome::ok(json::object());
    }

    mcp_log("protocol: unknown method " + method);
    return RpcOutcome::err(RPC_METHOD_NOT_FOUND, fmt::format("Method not found: {}", method));
}

json McpServer::initialize(const json& params) const {
    std::string version = MCP_PROTOCOL_VERSION;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }
    return {
        {"protocolVersion", version},
        {"capabilities", {
            {"tools", {{"listChanged", true}}},
            {"resources", {{"subscribe", true}, {"listChanged", true}}},
            {"logging", json::object()},
        }},
        {"serverInfo", {{"name", SERVER_NAME}, {"version", SERVER_VERSION}}},
    };
}

json McpServer::list_tools() const {
    json tools = json::array();
    for (const auto& name : tool_order_) {
        const auto& t = tools_.at(name);
        tools.push_back({{"name", name}, {"description", t.description},
                         {"inputSchema", t.input_schema}});
    }
    return {{"tools", tools}};
}

ToolResult McpServer::call_tool(const std::string& name, const json& args) {
    auto it = tools_.find(name);
    if (it == tools_.end()) return ToolResult::fail(fmt::format("Unknown tool: {}", name));
    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        mcp_log(fmt::format("tool {} threw: {}", name, e.what()));
        return ToolResult::fail(fmt::format("Error running {}: {}", name, e.what()));
    }
}

json McpServer::list_resources() {
    json arr = json::array();
    for (const auto& r : resources.list()) {
        json entry = {{"uri", r.uri}, {"name", r.name}};
        if (!r.description.empty()) entry["description"] = r.description;
        arr.push_back(entry);
    }
    return {{"resources", arr}};
}

json McpServer::list_resource_templates() const {
    json arr = json::array();
    for (const auto& t : resources.templates()) {
        arr.push_back({{"uriTemplate", t.uri_template}, {"name", t.name},
                       {"description", t.description}});
    }
    return {{"resourceTemplates", arr}};
}

RpcOutcome McpServer::read_resource(const json& params) {
    if (!params.contains("uri") || !params["uri"].is_string()) {
        return RpcOutcome::err(RPC_INVALID_PARAMS, "resources/read requires a uri");
    }
    std::string uri = params["uri"].get<std::string>();

    auto text = resources.read(uri);
    if (text.is_err()) return RpcOutcome::err(RPC_INVALID_PARAMS, text.error);

    json content = {{"uri", uri}, {"text", text.value}};
    content["mimeType"] = (uri == SESSIONS_URI) ? "application/json" : "text/plain";
    json contents = json::array();
    contents.push_back(content);
    return RpcOutcome::ok({{"contents", contents}});
}
