#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace linetrack {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = ctx.scheduler
                   ? ctx.scheduler->spawn([&cmd, &ctx, &args] { return cmd.execute(ctx, args); }).get()
                   : cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    return {};
}

}
