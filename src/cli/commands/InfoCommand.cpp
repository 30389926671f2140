#include "cli/commands/InfoCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"

namespace linetrack {

Expected<void> InfoCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "info: expected exactly one <file>"};
    }
    auto obj = CommandSupport::attachFile(ctx, args[0]);
    if (!obj) return obj.error();

    const Repository& repo = obj.value().repository();
    const FileProps& props = obj.value().props();

    std::cout << "toplevel:  " << repo.toplevel().string() << "\n";
    std::cout << "gitdir:    " << repo.gitdir().string() << "\n";
    std::cout << "head:      " << (repo.abbrevHead().empty() ? "(no commits)" : repo.abbrevHead()) << "\n";
    std::cout << "user:      " << repo.username() << "\n";
    std::cout << "relpath:   " << props.relpath << "\n";
    std::cout << "object:    " << props.objectName.value_or("(untracked)") << "\n";
    std::cout << "mode:      " << props.modeBits.value_or("-") << "\n";
    if (props.hasConflicts) {
        std::cout << "conflicts: yes (ancestor " << props.ancestorObjectName.value_or("none") << ")\n";
    } else {
        std::cout << "conflicts: no\n";
    }
    std::cout << "eol:       index " << (props.iCrlf ? "crlf" : "lf") << ", worktree " << (props.wCrlf ? "crlf" : "lf")
              << "\n";
    return {};
}

}
