#include <gtest/gtest.h>
#include <mcp/server.hpp>
#include <tmux/marker_protocol.hpp>
#include <algorithm>
#include <sstream>
#include "fake_pane_port.hpp"

static Config offline_config() {
    auto c = Config::from_yaml("tmux_binary: /nonexistent/tmux\ngit_binary: /nonexistent/git\n");
    EXPECT_TRUE(c.is_ok()) << c.error;
    return c.value;
}

class ServerTest : public ::testing::Test {
protected:
    FakePanePort panes;
    McpServer server{offline_config(), &panes};
    int next_id = 1;

    json request(const std::string& method, json params = json::object()) {
        json msg = {{"jsonrpc", "2.0"}, {"id", next_id++}, {"method", method},
                    {"params", params}};
        auto out = server.handle_line(msg.dump());
        EXPECT_TRUE(out.has_value());
        return out ? json::parse(*out) : json();
    }

    json call(const std::string& tool, json args) {
        return request("tools/call", {{"name", tool}, {"arguments", args}});
    }

    static std::string text_of(const json& response) {
        return response["result"]["content"][0]["text"].get<std::string>();
    }

    static std::string id_from(const std::string& text) {
        auto pos = text.rfind("Command ID: ");
        return pos == std::string::npos ? "" : text.substr(pos + 12);
    }
};

TEST_F(ServerTest, Initialize) {
    auto r = request("initialize", {{"protocolVersion", "2025-03-26"},
                                    {"capabilities", json::object()},
                                    {"clientInfo", {{"name", "t"}, {"version", "1"}}}});
    EXPECT_EQ(r["id"], 1);
    EXPECT_EQ(r["result"]["protocolVersion"], "2025-03-26");
    EXPECT_EQ(r["result"]["serverInfo"]["name"], "tmux-mcp");
    EXPECT_TRUE(r["result"]["capabilities"].contains("tools"));
    EXPECT_TRUE(r["result"]["capabilities"].contains("resources"));
}

TEST_F(ServerTest, ListsEveryTool) {
    auto r = request("tools/list");
    std::vector<std::string> names;
    for (const auto& t : r["result"]["tools"]) {
        names.push_back(t["name"].get<std::string>());
        EXPECT_EQ(t["inputSchema"]["type"], "object");
    }
    EXPECT_EQ(names.size(), 17u);
    for (const char* expected : {"list-sessions", "capture-pane", "execute-command",
                                 "get-command-result", "split-pane", "create-worktree",
                                 "launch-agent-pane"}) {
        EXPECT_NE(std::find(names.begin(), names.end(), expected), names.end()) << expected;
    }
}

TEST_F(ServerTest, NotificationsGetNoResponse) {
    auto out = server.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_FALSE(out.has_value());
    EXPECT_FALSE(server.handle_line("   ").has_value());
}

TEST_F(ServerTest, ParseErrorAndUnknownMethod) {
    auto bad = json::parse(*server.handle_line("{not json"));
    EXPECT_EQ(bad["error"]["code"], -32700);
    EXPECT_TRUE(bad["id"].is_null());

    auto unknown = request("tools/explode");
    EXPECT_EQ(unknown["error"]["code"], -32601);
}

TEST_F(ServerTest, UnknownToolIsInvalidParams) {
    auto r = call("no-such-tool", json::object());
    EXPECT_EQ(r["error"]["code"], -32602);
}

TEST_F(ServerTest, ExecuteThenPollResult) {
    auto started = call("execute-command", {{"paneId", "%1"}, {"command", "echo hi"}});
    std::string text = text_of(started);
    EXPECT_FALSE(started["result"].contains("isError"));
    EXPECT_NE(text.find("Command execution started."), std::string::npos);

    std::string id = id_from(text);
    ASSERT_EQ(id.size(), 36u);
    EXPECT_NE(text.find("tmux://command/" + id + "/result"), std::string::npos);

    auto pending = call("get-command-result", {{"commandId", id}});
    EXPECT_EQ(text_of(pending).rfind("Command still executing...", 0), 0u);

    panes.screens["%1"] = start_marker(id) + "\nhi\n" + end_marker(id, 0) + "\n$";
    auto done = call("get-command-result", {{"commandId", id}});
    EXPECT_EQ(text_of(done), "Status: completed\nExit code: 0\nCommand: echo hi\n\n--- Output ---\nhi");

    auto resource = request("resources/read", {{"uri", "tmux://command/" + id + "/result"}});
    EXPECT_EQ(resource["result"]["contents"][0]["text"].get<std::string>(), text_of(done));
    EXPECT_EQ(resource["result"]["contents"][0]["mimeType"], "text/plain");
}

TEST_F(ServerTest, BusyPaneIsAToolError) {
    call("execute-command", {{"paneId", "%1"}, {"command", "sleep 100"}});
    auto second = call("execute-command", {{"paneId", "%1"}, {"command", "ls"}});
    EXPECT_EQ(second["result"]["isError"], true);
    EXPECT_NE(text_of(second).find("busy"), std::string::npos);
}

TEST_F(ServerTest, RawModeResponse) {
    auto r = call("execute-command", {{"paneId", "%1"}, {"command", "python3"}, {"rawMode", true}});
    std::string text = text_of(r);
    EXPECT_EQ(text.rfind("Interactive command started (rawMode).", 0), 0u);
    EXPECT_NE(text.find("capture-pane"), std::string::npos);
}

TEST_F(ServerTest, MissingArgumentIsToolError) {
    auto r = call("execute-command", {{"paneId", "%1"}});
    EXPECT_EQ(r["result"]["isError"], true);
    EXPECT_NE(text_of(r).find("command"), std::string::npos);

    auto wrong = call("execute-command", {{"paneId", 3}, {"command", "ls"}});
    EXPECT_EQ(wrong["result"]["isError"], true);
}

TEST_F(ServerTest, UnknownCommandIdIsToolError) {
    auto r = call("get-command-result", {{"commandId", "ghost"}});
    EXPECT_EQ(r["result"]["isError"], true);
    EXPECT_EQ(text_of(r), "Command not found: ghost");
}

TEST_F(ServerTest, ReadUnknownResource) {
    auto r = request("resources/read", {{"uri", "tmux://nowhere"}});
    ASSERT_TRUE(r.contains("error"));
    EXPECT_NE(r["error"]["message"].get<std::string>().find("tmux://nowhere"), std::string::npos);
}

TEST_F(ServerTest, ResourceTemplatesAndList) {
    auto t = request("resources/templates/list");
    EXPECT_EQ(t["result"]["resourceTemplates"].size(), 2u);

    call("execute-command", {{"paneId", "%1"}, {"command", "echo a"}});
    auto l = request("resources/list");
    const auto& resources = l["result"]["resources"];
    ASSERT_EQ(resources.size(), 2u);
    EXPECT_EQ(resources[0]["uri"], "tmux://sessions");
    EXPECT_EQ(resources[1]["name"], "Command: echo a");
}

TEST_F(ServerTest, TmuxFailureIsToolError) {
    auto r = call("list-windows", {{"sessionId", "$0"}});
    EXPECT_EQ(r["result"]["isError"], true);
}

TEST_F(ServerTest, SplitPaneValidatesDirection) {
    auto r = call("split-pane", {{"paneId", "%1"}, {"direction", "diagonal"}});
    EXPECT_EQ(r["result"]["isError"], true);
}

TEST_F(ServerTest, RunLoopAnswersEachRequestLine) {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");
    std::ostringstream out;
    server.run(in, out);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> responses;
    while (std::getline(lines, line)) responses.push_back(json::parse(line));
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["id"], 2);
}

TEST_F(ServerTest, SetLogLevelIsAcknowledged) {
    auto r = request("logging/setLevel", {{"level", "debug"}});
    EXPECT_TRUE(r["result"].is_object());
    EXPECT_TRUE(r["result"].empty());
    EXPECT_FALSE(r.contains("error"));
}

TEST_F(ServerTest, EmptyCommandIsToolError) {
    auto r = call("execute-command", {{"paneId", "%1"}, {"command", "  "}});
    EXPECT_EQ(r["result"]["isError"], true);
    EXPECT_NE(text_of(r).find("empty"), std::string::npos);
    EXPECT_TRUE(panes.sent_text.empty());
}

TEST_F(ServerTest, OversizedSplitSizeIsRejected) {
    auto r = call("split-pane", {{"paneId", "%1"}, {"size", 4294967346LL}});
    EXPECT_EQ(r["result"]["isError"], true);
    EXPECT_NE(text_of(r).find("must be a number"), std::string::npos);
}
