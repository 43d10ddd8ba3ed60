#include <gtest/gtest.h>
#include <managers/worktree_manager.hpp>

static const char* kPorcelain =
    "worktree /home/dev/proj\n"
    "HEAD 1111111111111111111111111111111111111111\n"
    "branch refs/heads/main\n"
    "\n"
    "worktree /home/dev/feature-x\n"
    "HEAD 2222222222222222222222222222222222222222\n"
    "branch refs/heads/feature-x\n"
    "locked under review\n"
    "\n"
    "worktree ../scratch\n"
    "HEAD 3333333333333333333333333333333333333333\n"
    "detached\n"
    "prunable gitdir file points to non-existent location\n"
    "\n";

TEST(Worktree, ParsesPorcelainBlocks) {
    auto wts = parse_worktree_porcelain(kPorcelain, "/home/dev/proj");
    ASSERT_EQ(wts.size(), 3u);

    EXPECT_EQ(wts[0].path, "/home/dev/proj");
    EXPECT_EQ(wts[0].branch, std::optional<std::string>("main"));
    EXPECT_EQ(wts[0].head, std::optional<std::string>(std::string(40, '1')));
    EXPECT_FALSE(wts[0].locked.has_value());

    EXPECT_EQ(wts[1].branch, std::optional<std::string>("feature-x"));
    EXPECT_EQ(wts[1].locked, std::optional<std::string>("under review"));

    EXPECT_EQ(wts[2].path, "/home/dev/scratch");
    EXPECT_TRUE(wts[2].detached);
    EXPECT_FALSE(wts[2].branch.has_value());
    EXPECT_EQ(wts[2].prunable,
              std::optional<std::string>("gitdir file points to non-existent location"));
}

TEST(Worktree, BareFlagsWithoutReason) {
    auto wts = parse_worktree_porcelain("worktree /srv/repo.git\nbare\n\n"
                                        "worktree /srv/wt\nHEAD abc\nbranch refs/heads/x\nlocked\n",
                                        "/srv");
    ASSERT_EQ(wts.size(), 2u);
    EXPECT_TRUE(wts[0].bare);
    EXPECT_EQ(wts[1].locked, std::optional<std::string>("locked"));
}

TEST(Worktree, EmptyListing) {
    EXPECT_TRUE(parse_worktree_porcelain("", "/x").empty());
}

TEST(Worktree, NormalizePath) {
    EXPECT_EQ(normalize_path("/a/b/../c/"), "/a/c");
    EXPECT_EQ(normalize_path("../feature", "/home/dev/proj"), "/home/dev/feature");
    EXPECT_EQ(normalize_path("/abs", "/ignored"), "/abs");
    EXPECT_EQ(normalize_path("/"), "/");
}

TEST(Worktree, AddArgsForExistingBranch) {
    EnsureWorktreeOptions opts;
    opts.branch_name = "feature";
    auto args = worktree_add_args(opts, "/wt/feature");
    std::vector<std::string> expected = {"worktree", "add", "/wt/feature", "feature"};
    EXPECT_EQ(args, expected);
}

TEST(Worktree, AddArgsForNewBranch) {
    EnsureWorktreeOptions opts;
    opts.branch_name = "feature";
    opts.create_branch = true;
    opts.base_ref = "origin/main";
    opts.force = true;
    auto args = worktree_add_args(opts, "/wt/feature");
    std::vector<std::string> expected = {"worktree", "add", "--force", "-b", "feature",
                                         "/wt/feature", "origin/main"};
    EXPECT_EQ(args, expected);
}

TEST(Worktree, EnsureValidatesBeforeTouchingGit) {
    WorktreeManager mgr("/nonexistent/git");

    EnsureWorktreeOptions blank;
    blank.repo_path = "/tmp";
    blank.branch_name = "  ";
    EXPECT_EQ(mgr.ensure(blank).error, "branchName is required");

    EnsureWorktreeOptions base_only;
    base_only.repo_path = "/tmp";
    base_only.branch_name = "x";
    base_only.base_ref = "main";
    EXPECT_EQ(mgr.ensure(base_only).error, "baseRef can only be used when createBranch is true");
}

TEST(Worktree, GitFailureIsReported) {
    WorktreeManager mgr("/nonexistent/git");
    auto r = mgr.list("/tmp");
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("git rev-parse"), std::string::npos);
}
