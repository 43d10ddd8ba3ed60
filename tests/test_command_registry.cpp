#include <gtest/gtest.h>
#include <managers/command_registry.hpp>

using namespace std::chrono;

static Command make_command(const std::string& id, CommandRegistry::Clock::time_point start) {
    Command c;
    c.id = id;
    c.pane_id = "%1";
    c.command = "echo " + id;
    c.start_time = start;
    return c;
}

TEST(CommandRegistry, ListsInInsertionOrder) {
    CommandRegistry reg;
    auto now = CommandRegistry::Clock::now();
    EXPECT_TRUE(reg.insert(make_command("zeta", now)));
    EXPECT_TRUE(reg.insert(make_command("alpha", now)));
    EXPECT_TRUE(reg.insert(make_command("mid", now)));

    auto ids = reg.list_active();
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], "zeta");
    EXPECT_EQ(ids[1], "alpha");
    EXPECT_EQ(ids[2], "mid");
}

TEST(CommandRegistry, RejectsDuplicateIds) {
    CommandRegistry reg;
    auto now = CommandRegistry::Clock::now();
    EXPECT_TRUE(reg.insert(make_command("c1", now)));
    EXPECT_FALSE(reg.insert(make_command("c1", now)));
    EXPECT_EQ(reg.size(), 1u);
}

TEST(CommandRegistry, UnknownIdIsAbsent) {
    CommandRegistry reg;
    EXPECT_FALSE(reg.get("nope").has_value());
    EXPECT_FALSE(reg.contains("nope"));
    EXPECT_FALSE(reg.finish("nope", 0, 0, "", false));
}

TEST(CommandRegistry, FinishMapsExitCodeToStatus) {
    CommandRegistry reg;
    auto now = CommandRegistry::Clock::now();
    reg.insert(make_command("ok", now));
    reg.insert(make_command("bad", now));

    EXPECT_TRUE(reg.finish("ok", 0, 0, "done", false));
    EXPECT_TRUE(reg.finish("bad", 2, 0, "oops", true));

    auto ok = reg.get("ok");
    EXPECT_EQ(ok->status, CommandStatus::Completed);
    EXPECT_EQ(ok->exit_code, 0);
    EXPECT_EQ(ok->result, "done");
    EXPECT_FALSE(ok->output_truncated);

    auto bad = reg.get("bad");
    EXPECT_EQ(bad->status, CommandStatus::Error);
    EXPECT_EQ(bad->exit_code, 2);
    EXPECT_TRUE(bad->output_truncated);
}

TEST(CommandRegistry, TerminalStatusNeverChanges) {
    CommandRegistry reg;
    reg.insert(make_command("c1", CommandRegistry::Clock::now()));
    reg.finish("c1", 0, 0, "first", false);

    EXPECT_FALSE(reg.finish("c1", 1, 0, "second", false));
    EXPECT_FALSE(reg.set_tracking_lost("c1", true));

    auto c = reg.get("c1");
    EXPECT_EQ(c->status, CommandStatus::Completed);
    EXPECT_EQ(c->result, "first");
    EXPECT_FALSE(c->tracking_lost);
}

TEST(CommandRegistry, RawCommandsStayPending) {
    CommandRegistry reg;
    auto c = make_command("raw", CommandRegistry::Clock::now());
    c.raw_mode = true;
    reg.insert(c);

    EXPECT_FALSE(reg.finish("raw", 0, 0, "x", false));
    EXPECT_EQ(reg.get("raw")->status, CommandStatus::Pending);
}

TEST(CommandRegistry, TrackingLostIsClearedOnFinish) {
    CommandRegistry reg;
    reg.insert(make_command("c1", CommandRegistry::Clock::now()));
    EXPECT_TRUE(reg.set_tracking_lost("c1", true));
    EXPECT_TRUE(reg.get("c1")->tracking_lost);

    reg.finish("c1", 0, 0, "", false);
    EXPECT_FALSE(reg.get("c1")->tracking_lost);
}

TEST(CommandRegistry, SweepEvictsOnlyOldEntries) {
    CommandRegistry reg;
    auto now = CommandRegistry::Clock::now();
    reg.insert(make_command("old-pending", now - minutes(11)));
    reg.insert(make_command("fresh", now - minutes(5)));
    reg.insert(make_command("old-done", now - minutes(20)));
    reg.finish("old-done", 0, 0, "", false);

    auto evicted = reg.sweep(minutes(10), now);
    ASSERT_EQ(evicted.size(), 2u);
    EXPECT_EQ(evicted[0], "old-pending");
    EXPECT_EQ(evicted[1], "old-done");

    auto ids = reg.list_active();
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], "fresh");
    EXPECT_FALSE(reg.get("old-pending").has_value());
}

TEST(CommandRegistry, SweepWithNothingOld) {
    CommandRegistry reg;
    auto now = CommandRegistry::Clock::now();
    reg.insert(make_command("a", now));
    EXPECT_TRUE(reg.sweep(minutes(10), now).empty());
    EXPECT_EQ(reg.size(), 1u);
}

TEST(CommandRegistry, StatusNames) {
    EXPECT_STREQ(command_status_name(CommandStatus::Pending), "pending");
    EXPECT_STREQ(command_status_name(CommandStatus::Completed), "completed");
    EXPECT_STREQ(command_status_name(CommandStatus::Error), "error");
}
