#include "cli/commands/UnstageCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/Diff.hpp"

namespace linetrack {

Expected<void> UnstageCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::string fileArg;
    bool byHunks = false;
    for (const auto& a : args) {
        if (a == "--hunks") {
            byHunks = true;
        } else if (fileArg.empty()) {
            fileArg = a;
        } else {
            return Error{ErrorCode::InvalidArgs, "unstage: unexpected argument " + a};
        }
    }
    if (fileArg.empty()) {
        return Error{ErrorCode::InvalidArgs, "unstage: missing <file>"};
    }

    auto obj = CommandSupport::attachFile(ctx, fileArg);
    if (!obj) return obj.error();
    FileObject& file = obj.value();

    if (!byHunks) {
        auto res = file.unstageFile();
        if (!res) return res;
        std::cout << "Unstaged " << file.props().relpath << "\n";
        return {};
    }

    if (!ctx.git) {
        return Error{ErrorCode::InternalError, "No git capabilities configured"};
    }
    auto committed = file.getShowText("HEAD");
    if (!committed) return committed.error();
    auto staged = file.getShowText("");
    if (!staged) return staged.error();

    auto hunks = Diff::run(*ctx.git, committed.value(), staged.value());
    if (!hunks) return hunks.error();
    if (hunks.value().empty()) {
        std::cout << "Nothing staged for " << file.props().relpath << "\n";
        return {};
    }

    auto res = file.stageHunks(hunks.value(), true);
    if (!res) return res;
    std::cout << "Unstaged " << hunks.value().size() << " hunk(s) of " << file.props().relpath << "\n";
    return {};
}

}
