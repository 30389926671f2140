#include "cli/commands/StageCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/Diff.hpp"
#include "util/StringUtils.hpp"

namespace linetrack {

Expected<void> StageCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::string fileArg;
    std::optional<std::pair<int, int>> range;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-L") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "stage: -L requires <start>,<end>"};
            }
            auto bounds = StringUtils::split(args[++i], ',');
            if (bounds.size() != 2) {
                return Error{ErrorCode::InvalidArgs, "stage: invalid range " + args[i]};
            }
            auto first = CommandSupport::parseLineNumber(bounds[0]);
            if (!first) return first.error();
            auto last = CommandSupport::parseLineNumber(bounds[1]);
            if (!last) return last.error();
            range = std::make_pair(first.value(), last.value());
        } else if (fileArg.empty()) {
            fileArg = args[i];
        } else {
            return Error{ErrorCode::InvalidArgs, "stage: unexpected argument " + args[i]};
        }
    }
    if (fileArg.empty()) {
        return Error{ErrorCode::InvalidArgs, "stage: missing <file>"};
    }
    if (!ctx.git) {
        return Error{ErrorCode::InternalError, "No git capabilities configured"};
    }

    auto obj = CommandSupport::attachFile(ctx, fileArg);
    if (!obj) return obj.error();
    FileObject& file = obj.value();

    auto staged = file.getShowText("");
    if (!staged) return staged.error();
    auto working = CommandSupport::readLines(file.file());
    if (!working) return working.error();

    auto hunks = Diff::run(*ctx.git, staged.value(), working.value());
    if (!hunks) return hunks.error();
    std::vector<Hunk> selected = range ? Hunks::filterByNewRange(hunks.value(), range->first, range->second)
                                       : hunks.value();
    if (selected.empty()) {
        std::cout << "Nothing to stage for " << file.props().relpath << "\n";
        return {};
    }

    auto res = file.stageHunks(selected);
    if (!res) return res;
    std::cout << "Staged " << selected.size() << " hunk(s) of " << file.props().relpath << "\n";
    return {};
}

}
