#pragma once

#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace linetrack {

/**
 * @brief One external process invocation
 *
 * `inputLines`, when present, is written to the child's stdin with a newline
 * after each line, then stdin is closed. Otherwise stdin is closed at once.
 */
struct JobSpec {
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path cwd;
    std::optional<std::vector<std::string>> inputLines;
    bool suppressStderr{false};
};

/// Raw result of a finished process
struct ProcessOutput {
    std::string out;
    std::string err;
    int exitCode{0};
};

/// Result handed to callers: stdout split into lines plus verbatim stderr
struct CommandResult {
    std::vector<std::string> lines;
    std::string stderrText;
    int exitCode{0};
};

/**
 * @brief Split process stdout on '\n'
 *
 * A trailing newline does not produce a trailing empty element, so "a\nb\n"
 * and "a\nb" both give {"a", "b"} and "" gives {}.
 */
std::vector<std::string> splitOutputLines(const std::string& out);

/**
 * @brief Executes external commands
 *
 * Subclasses implement execute(); run() adds line splitting and reports
 * stderr through the Logger unless the job suppresses it. Exit codes are
 * surfaced but never interpreted here.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /// Run a job to completion, suspending only the calling task
    Expected<CommandResult> run(const JobSpec& spec);

    /// Run a job on a fresh thread; the future yields run()'s result
    std::future<Expected<CommandResult>> runAsync(JobSpec spec);

protected:
    virtual Expected<ProcessOutput> execute(const JobSpec& spec) = 0;
};

/**
 * @brief fork/exec implementation backed by pipes
 *
 * stdin, stdout and stderr are serviced with poll() so a child that writes
 * a lot before reading its input cannot deadlock. While waiting, the
 * scheduler run token of the calling task is released.
 */
class ProcessRunner : public ICommandRunner {
public:
    ProcessRunner();

protected:
    Expected<ProcessOutput> execute(const JobSpec& spec) override;
};

}
