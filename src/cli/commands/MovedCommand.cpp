#include "cli/commands/MovedCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"

namespace linetrack {

Expected<void> MovedCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "moved: expected exactly one <file>"};
    }
    auto obj = CommandSupport::attachFile(ctx, args[0]);
    if (!obj) return obj.error();
    FileObject& file = obj.value();

    // Once renamed in the index the old path is no longer listed
    if (file.props().relpath.empty()) {
        file.assumeRelpath(file.file().lexically_relative(file.repository().toplevel()).generic_string());
    }
    const std::string before = file.props().relpath;

    auto moved = file.hasMoved();
    if (!moved) return moved.error();

    if (moved.value()) {
        std::cout << "renamed: " << before << " -> " << *moved.value() << "\n";
    } else {
        std::cout << "not moved: " << before << "\n";
    }
    return {};
}

}
