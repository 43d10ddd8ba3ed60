#include <gtest/gtest.h>
#include <tmux/tmux_client.hpp>

TEST(TmuxClient, ParsesSessions) {
    auto s = parse_session_lines("$0\t1\t3\tmain\n$1\t0\t1\twork\twith tab\n\n");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0].id, "$0");
    EXPECT_TRUE(s[0].attached);
    EXPECT_EQ(s[0].windows, 3);
    EXPECT_EQ(s[0].name, "main");
    EXPECT_FALSE(s[1].attached);
    EXPECT_EQ(s[1].name, "work\twith tab");
}

TEST(TmuxClient, SkipsMalformedLines) {
    EXPECT_TRUE(parse_session_lines("garbage\n").empty());
    EXPECT_TRUE(parse_window_lines("@1\t1\n", "$0").empty());
}

TEST(TmuxClient, ParsesWindows) {
    auto w = parse_window_lines("@1\t1\tbash\n@2\t0\tvim\n", "$0");
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w[0].id, "@1");
    EXPECT_TRUE(w[0].active);
    EXPECT_EQ(w[1].name, "vim");
    EXPECT_EQ(w[1].session_id, "$0");
}

TEST(TmuxClient, ParsesPanes) {
    auto p = parse_pane_lines("%0\t1\tAgent | CODEX\n%3\t0\t\n", "@1");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0].title, "Agent | CODEX");
    EXPECT_EQ(p[1].id, "%3");
    EXPECT_EQ(p[1].title, "");
    EXPECT_EQ(p[1].window_id, "@1");
}

TEST(TmuxClient, SpecialKeys) {
    for (const char* k : {"Up", "Escape", "Tab", "Enter", "F5", "C-c", "M-x", "C-M-a", "S-a"}) {
        EXPECT_TRUE(TmuxClient::is_special_key(k)) << k;
    }
    for (const char* k : {"up", "hello", "C-", "X-c", "ls -la", "a"}) {
        EXPECT_FALSE(TmuxClient::is_special_key(k)) << k;
    }
}

TEST(TmuxClient, MissingBinaryFailsCleanly) {
    TmuxClient tmux("/nonexistent/tmux");
    EXPECT_TRUE(tmux.capture("%0", 10, false).is_err());
    EXPECT_TRUE(tmux.send_text("%0", "ls").is_err());
    EXPECT_TRUE(tmux.split_pane("%0", "sideways", std::nullopt).is_err());
    EXPECT_TRUE(tmux.split_pane("%0", "vertical", 100).is_err());
}
