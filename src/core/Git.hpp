#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/CommandRunner.hpp"
#include "core/Config.hpp"
#include "util/Expected.hpp"
#include "util/Version.hpp"

namespace linetrack {

/// Per-call knobs for Git::command
struct CommandOptions {
    std::string command;                                  // empty means the configured git binary
    std::filesystem::path cwd{};
    std::optional<std::vector<std::string>> input{};
    bool suppressStderr{false};
};

/**
 * @brief Capability object for talking to git
 *
 * Built once at startup and passed explicitly to every component that needs
 * version-gated behaviour. Owns no process state; all invocations go through
 * the supplied runner, which must outlive this object.
 */
class Git {
public:
    Git(ICommandRunner& runner, Config config, Version version);

    /**
     * @brief Build from configuration
     *
     * Probes `git --version` when config.gitVersion is "auto", otherwise
     * parses it. A malformed version string throws InvalidVersion.
     */
    static Expected<Git> create(ICommandRunner& runner, const Config& config);

    /// Parse the first line of `git --version` output
    static Expected<Version> detectVersion(ICommandRunner& runner, const std::string& gitCommand);

    const Version& version() const { return gitVersion; }
    const Config& config() const { return cfg; }
    ICommandRunner& runner() const { return *commandRunner; }

    /// rev-parse --absolute-git-dir needs git 2.13
    bool hasAbsoluteGitDir() const;

    /// Run a command; git invocations get --no-pager --literal-pathspecs first
    Expected<CommandResult> command(const std::vector<std::string>& args, const CommandOptions& opts = {}) const;

private:
    ICommandRunner* commandRunner;
    Config cfg;
    Version gitVersion;
};

}
