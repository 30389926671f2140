#include "core/Git.hpp"

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace linetrack {

Git::Git(ICommandRunner& runner, Config config, Version version)
    : commandRunner(&runner), cfg(std::move(config)), gitVersion(version) {}

Expected<Git> Git::create(ICommandRunner& runner, const Config& config) {
    if (config.gitVersion != "auto") {
        return Git(runner, config, Version::parse(config.gitVersion));
    }
    auto detected = detectVersion(runner, config.gitCommand);
    if (!detected) return detected.error();
    Logger::instance().debug("Detected git " + detected.value().toString());
    return Git(runner, config, detected.value());
}

Expected<Version> Git::detectVersion(ICommandRunner& runner, const std::string& gitCommand) {
    JobSpec spec;
    spec.command = gitCommand;
    spec.args = {"--version"};
    auto res = runner.run(spec);
    if (!res) return res.error();

    const auto& lines = res.value().lines;
    if (lines.empty()) {
        return Error{ErrorCode::CommandFailed,
                     "Unable to detect git version as \"" + gitCommand + " --version\" failed to return anything"};
    }
    auto tokens = StringUtils::splitWhitespace(lines.front());
    if (tokens.size() < 3 || tokens[0] != "git" || tokens[1] != "version") {
        return Error{ErrorCode::CommandFailed, "Unable to parse git version from: " + lines.front()};
    }
    return Version::parse(tokens[2]);
}

bool Git::hasAbsoluteGitDir() const {
    return gitVersion.atLeast({Constants::ABSOLUTE_GIT_DIR_MAJOR, Constants::ABSOLUTE_GIT_DIR_MINOR});
}

Expected<CommandResult> Git::command(const std::vector<std::string>& args, const CommandOptions& opts) const {
    JobSpec spec;
    spec.command = opts.command.empty() ? cfg.gitCommand : opts.command;
    if (spec.command == cfg.gitCommand) {
        spec.args = {"--no-pager", "--literal-pathspecs"};
    }
    spec.args.insert(spec.args.end(), args.begin(), args.end());
    spec.cwd = opts.cwd;
    spec.inputLines = opts.input;
    spec.suppressStderr = opts.suppressStderr;
    return commandRunner->run(spec);
}

}
