#include "cli/commands/ShowCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"

namespace linetrack {

Expected<void> ShowCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        return Error{ErrorCode::InvalidArgs, "show: usage: show <file> [<revision>]"};
    }
    auto obj = CommandSupport::attachFile(ctx, args[0]);
    if (!obj) return obj.error();

    auto text = obj.value().getShowText(args.size() > 1 ? args[1] : "");
    if (!text) return text.error();
    for (const auto& line : text.value()) {
        std::cout << line << "\n";
    }
    return {};
}

}
