// CLI entry: build the shared services once, then dispatch through the command factory.

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "core/CommandRunner.hpp"
#include "core/Config.hpp"
#include "core/Git.hpp"
#include "core/Repository.hpp"
#include "core/Scheduler.hpp"
#include "util/Logger.hpp"
#include "util/Version.hpp"

using namespace linetrack;

int main(int argc, char** argv) {
    auto& factory = CommandFactory::instance();
    factory.registerBuiltins();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    Config config = Config::fromEnvironment();
    ProcessRunner runner;

    std::optional<Git> git;
    try {
        auto created = Git::create(runner, config);
        if (!created) {
            Logger::instance().error(created.error().message);
            return 1;
        }
        git.emplace(std::move(created.value()));
    } catch (const InvalidVersion& e) {
        Logger::instance().error(e.what());
        return 1;
    }

    RepositoryCache repos(*git);
    Scheduler scheduler;
    AppContext ctx{config, &*git, &repos, &scheduler};
    CommandInvoker invoker;

    if (args.empty()) {
        auto cmd = factory.create("help");
        invoker.invoke(*cmd, ctx, {});
        return 0;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = factory.create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = factory.create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
