#include <gtest/gtest.h>

#include "FakeCommandRunner.hpp"
#include "core/Git.hpp"

using namespace linetrack;
using namespace linetrack::test;

TEST(GitTest, DetectsVersionFromGit) {
    FakeCommandRunner runner;
    runner.respond("--version", {"git version 2.39.5"});

    auto git = Git::create(runner, Config{});
    ASSERT_TRUE(git.has_value()) << git.error().message;
    EXPECT_EQ(git.value().version(), (Version{2, 39, 5}));
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].command, "git");
}

TEST(GitTest, DetectsVendorVersion) {
    FakeCommandRunner runner;
    runner.respond("--version", {"git version 2.39.3 (Apple Git-146)"});
    auto version = Git::detectVersion(runner, "git");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version.value(), (Version{2, 39, 3}));
}

TEST(GitTest, EmptyVersionOutputFails) {
    FakeCommandRunner runner;
    auto git = Git::create(runner, Config{});
    ASSERT_FALSE(git.has_value());
    EXPECT_EQ(git.error().code, ErrorCode::CommandFailed);
}

TEST(GitTest, ConfiguredVersionSkipsProbe) {
    FakeCommandRunner runner;
    Config cfg;
    cfg.gitVersion = "2.12.0";

    auto git = Git::create(runner, cfg);
    ASSERT_TRUE(git.has_value());
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_FALSE(git.value().hasAbsoluteGitDir());
}

TEST(GitTest, MalformedConfiguredVersionThrows) {
    FakeCommandRunner runner;
    Config cfg;
    cfg.gitVersion = "2.x";
    EXPECT_THROW(Git::create(runner, cfg), InvalidVersion);
}

TEST(GitTest, GitInvocationsGetStandardFlags) {
    FakeCommandRunner runner;
    Git git(runner, Config{}, Version{2, 39, 0});
    EXPECT_TRUE(git.hasAbsoluteGitDir());

    auto res = git.command({"status"}, CommandOptions{"", "/tmp", std::nullopt, true});
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(runner.calls.size(), 1u);
    const JobSpec& job = runner.calls[0];
    EXPECT_EQ(job.command, "git");
    EXPECT_EQ(job.args, (std::vector<std::string>{"--no-pager", "--literal-pathspecs", "status"}));
    EXPECT_EQ(job.cwd, std::filesystem::path("/tmp"));
    EXPECT_TRUE(job.suppressStderr);
}

TEST(GitTest, OtherToolsRunWithoutGitFlags) {
    FakeCommandRunner runner;
    Git git(runner, Config{}, Version{2, 39, 0});
    auto res = git.command({"ls-files"}, CommandOptions{"yadm", {}, std::nullopt, false});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(runner.calls[0].command, "yadm");
    EXPECT_EQ(runner.calls[0].args, (std::vector<std::string>{"ls-files"}));
}
