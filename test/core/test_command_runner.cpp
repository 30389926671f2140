#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "test_utils.hpp"
#include "core/CommandRunner.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

using namespace linetrack;
using namespace linetrack::test::utils;

TEST(SplitOutputLinesTest, TrailingNewlineAddsNoElement) {
    EXPECT_EQ(splitOutputLines("a\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(splitOutputLines("a\nb"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(splitOutputLines("").empty());
    EXPECT_EQ(splitOutputLines("\n"), (std::vector<std::string>{""}));
    EXPECT_EQ(splitOutputLines("a\n\nb\n"), (std::vector<std::string>{"a", "", "b"}));
}

TEST(SplitOutputLinesTest, CarriageReturnsAreKept) {
    EXPECT_EQ(splitOutputLines("a\r\nb\r\n"), (std::vector<std::string>{"a\r", "b\r"}));
}

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedLevel = Logger::instance().level();
        Logger::instance().setLevel(LogLevel::Warn);
        Logger::instance().setSink([this](LogLevel lvl, const std::string& msg) {
            if (lvl == LogLevel::Warn) warnings.push_back(msg);
        });
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setLevel(savedLevel);
    }

    JobSpec shell(const std::string& script) {
        JobSpec spec;
        spec.command = "sh";
        spec.args = {"-c", script};
        return spec;
    }

    ProcessRunner runner;
    LogLevel savedLevel{LogLevel::Info};
    std::vector<std::string> warnings;
};

TEST_F(ProcessRunnerTest, FeedsInputLinesToStdin) {
    JobSpec spec;
    spec.command = "cat";
    spec.inputLines = std::vector<std::string>{"one", "", "three"};
    auto res = runner.run(spec);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().exitCode, 0);
    EXPECT_EQ(res.value().lines, (std::vector<std::string>{"one", "", "three"}));
}

TEST_F(ProcessRunnerTest, LargeInputAndOutputDoNotDeadlock) {
    std::vector<std::string> input(20000, std::string(100, 'x'));
    JobSpec spec;
    spec.command = "cat";
    spec.inputLines = input;
    auto res = runner.run(spec);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().lines.size(), input.size());
}

TEST_F(ProcessRunnerTest, ReportsExitCodeAndStderr) {
    auto res = runner.run(shell("echo out; echo problem >&2; exit 3"));
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().exitCode, 3);
    EXPECT_EQ(res.value().lines, (std::vector<std::string>{"out"}));
    EXPECT_EQ(res.value().stderrText, "problem\n");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("problem"), std::string::npos);
}

TEST_F(ProcessRunnerTest, SuppressedStderrIsNotLogged) {
    JobSpec spec = shell("echo quiet >&2");
    spec.suppressStderr = true;
    auto res = runner.run(spec);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().stderrText, "quiet\n");
    EXPECT_TRUE(warnings.empty());
}

TEST_F(ProcessRunnerTest, RunsInWorkingDirectory) {
    fs::path dir = createTempDir();
    JobSpec spec;
    spec.command = "pwd";
    spec.cwd = dir;
    auto res = runner.run(spec);
    removeDir(dir);
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(res.value().lines.size(), 1u);
    EXPECT_EQ(fs::path(res.value().lines[0]), dir);
}

TEST_F(ProcessRunnerTest, MissingExecutableIsSpawnFailure) {
    JobSpec spec;
    spec.command = "/nonexistent/linetrack-no-such-binary";
    auto res = runner.run(spec);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SpawnFailed);
}

TEST_F(ProcessRunnerTest, MissingWorkingDirectoryIsSpawnFailure) {
    JobSpec spec;
    spec.command = "true";
    spec.cwd = "/nonexistent/linetrack-no-such-dir";
    auto res = runner.run(spec);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SpawnFailed);
}

TEST_F(ProcessRunnerTest, ChildIgnoringInputDoesNotKillCaller) {
    JobSpec spec = shell("exit 0");
    spec.inputLines = std::vector<std::string>(50000, "ignored input line");
    auto res = runner.run(spec);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().exitCode, 0);
}

TEST_F(ProcessRunnerTest, RunAsyncDeliversResult) {
    auto fut = runner.runAsync(shell("printf 'a\\nb'"));
    auto res = fut.get();
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().lines, (std::vector<std::string>{"a", "b"}));
}
