#include "cli/commands/BlameCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"

namespace linetrack {

namespace {

void printField(const char* label, const std::optional<std::string>& value) {
    if (value) std::cout << label << *value << "\n";
}

}

Expected<void> BlameCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    bool ignoreWhitespace = false;
    for (const auto& a : args) {
        if (a == "-w") {
            ignoreWhitespace = true;
        } else {
            positional.push_back(a);
        }
    }
    if (positional.size() != 2) {
        return Error{ErrorCode::InvalidArgs, "blame: usage: blame <file> <line> [-w]"};
    }

    auto lnum = CommandSupport::parseLineNumber(positional[1]);
    if (!lnum) return lnum.error();
    auto obj = CommandSupport::attachFile(ctx, positional[0]);
    if (!obj) return obj.error();
    auto lines = CommandSupport::readLines(obj.value().file());
    if (!lines) return lines.error();

    auto blame = obj.value().runBlame(lines.value(), lnum.value(), ignoreWhitespace);
    if (!blame) return blame.error();
    if (!blame.value()) {
        std::cout << "No blame information for line " << lnum.value() << "\n";
        return {};
    }

    const BlameInfo& info = *blame.value();
    std::cout << "commit:    " << info.abbrevSha << " (" << info.sha << ")\n";
    std::cout << "lines:     " << info.origLnum << " -> " << info.finalLnum << "\n";
    if (info.author) {
        std::cout << "author:    " << *info.author << " " << info.authorMail.value_or("") << "\n";
    }
    if (info.committer) {
        std::cout << "committer: " << *info.committer << " " << info.committerMail.value_or("") << "\n";
    }
    printField("summary:   ", info.summary);
    if (info.previousSha) {
        std::cout << "previous:  " << *info.previousSha << " " << info.previousFilename.value_or("") << "\n";
    }
    return {};
}

}
