#include "cli/commands/ChangedCommand.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace linetrack {

Expected<void> ChangedCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "changed: too many arguments"};
    }
    if (!ctx.repos) {
        return Error{ErrorCode::InternalError, "No repository cache configured"};
    }

    fs::path dir = args.empty() ? fs::current_path() : fs::absolute(args[0]);
    auto repo = ctx.repos->open(dir.lexically_normal());
    if (!repo) return repo.error();

    auto changed = repo.value()->filesChanged();
    if (!changed) return changed.error();
    for (const auto& path : changed.value()) {
        std::cout << path << "\n";
    }
    return {};
}

}
