#include "cli/commands/StageBufferCommand.hpp"

#include <filesystem>
#include <iostream>

#include "cli/CommandSupport.hpp"

namespace fs = std::filesystem;

namespace linetrack {

Expected<void> StageBufferCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        return Error{ErrorCode::InvalidArgs, "stage-buffer: usage: stage-buffer <file> [<source>]"};
    }
    auto obj = CommandSupport::attachFile(ctx, args[0]);
    if (!obj) return obj.error();
    FileObject& file = obj.value();

    fs::path source = args.size() > 1 ? fs::absolute(args[1]) : file.file();
    auto lines = CommandSupport::readLines(source);
    if (!lines) return lines.error();

    auto res = file.stageLines(lines.value());
    if (!res) return res;
    std::cout << "Staged " << lines.value().size() << " line(s) as " << file.props().relpath << "\n";
    return {};
}

}
