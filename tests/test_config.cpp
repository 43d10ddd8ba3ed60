#include <gtest/gtest.h>
#include <core/config.hpp>
#include <fstream>

TEST(Config, Defaults) {
    Config c = Config::defaults();
    EXPECT_EQ(c.shell(), ShellKind::Bash);
    EXPECT_EQ(c.tmux_binary(), "tmux");
    EXPECT_EQ(c.capture_lines(), 1000);
    EXPECT_EQ(c.resource_capture_lines(), 200);
    EXPECT_EQ(c.retention_minutes(), 10);
    EXPECT_EQ(c.lost_after_seconds(), 30);
    EXPECT_EQ(c.initial_message_delay_ms(), 500);
    EXPECT_EQ(c.agent_command("codex"), std::optional<std::string>("codex"));
    EXPECT_FALSE(c.agent_command("nope").has_value());
}

TEST(Config, EmptyDocumentIsDefaults) {
    auto r = Config::from_yaml("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.capture_lines(), 1000);
}

TEST(Config, ReadsKeys) {
    auto r = Config::from_yaml(
        "shell_type: fish\n"
        "tmux_binary: /opt/bin/tmux\n"
        "capture_lines: 5000\n"
        "lost_after_seconds: 0\n"
        "log_file: /tmp/mcp.log\n"
        "agents:\n"
        "  claudecode: claude --dangerously-skip-permissions\n"
        "  aider: aider --yes\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.shell(), ShellKind::Fish);
    EXPECT_EQ(r.value.tmux_binary(), "/opt/bin/tmux");
    EXPECT_EQ(r.value.capture_lines(), 5000);
    EXPECT_EQ(r.value.lost_after_seconds(), 0);
    EXPECT_EQ(r.value.log_file(), "/tmp/mcp.log");
    EXPECT_EQ(r.value.agent_command("claudecode"),
              std::optional<std::string>("claude --dangerously-skip-permissions"));
    EXPECT_EQ(r.value.agent_command("aider"), std::optional<std::string>("aider --yes"));
    EXPECT_EQ(r.value.agent_command("gemini"), std::optional<std::string>("gemini"));
}

TEST(Config, RejectsUnknownShell) {
    auto r = Config::from_yaml("shell_type: powershell\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("powershell"), std::string::npos);
}

TEST(Config, RejectsBadNumbers) {
    EXPECT_TRUE(Config::from_yaml("capture_lines: 0\n").is_err());
    EXPECT_TRUE(Config::from_yaml("capture_lines: -5\n").is_err());
    EXPECT_TRUE(Config::from_yaml("retention_minutes: soon\n").is_err());
}

TEST(Config, RejectsMalformedDocuments) {
    EXPECT_TRUE(Config::from_yaml("- a\n- b\n").is_err());
    EXPECT_TRUE(Config::from_yaml("capture_lines: [1\n").is_err());
    EXPECT_TRUE(Config::from_yaml("agents: codex\n").is_err());
}

TEST(Config, ShellOverride) {
    Config c = Config::defaults();
    EXPECT_TRUE(c.set_shell("zsh").is_ok());
    EXPECT_EQ(c.shell(), ShellKind::Zsh);
    EXPECT_TRUE(c.set_shell("cmd").is_err());
    EXPECT_EQ(c.shell(), ShellKind::Zsh);
}

TEST(Config, LoadFile) {
    auto path = fs::temp_directory_path() / "tmux_mcp_config_test.yaml";
    {
        std::ofstream out(path);
        out << "resource_capture_lines: 50\n";
    }
    auto r = Config::load_file(path);
    fs::remove(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.resource_capture_lines(), 50);

    EXPECT_TRUE(Config::load_file(path).is_err());
}
