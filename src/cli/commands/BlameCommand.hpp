#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class BlameCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "blame"; }
    const char* description() const override { return "Show who last changed a line"; }
    const char* helpNameLine() const override { return "blame -  Show the commit that last touched one line"; }
    const char* helpSynopsis() const override { return "linetrack blame <file> <line> [-w]"; }
    const char* helpDescription() const override { return "Blame a single line of <file> using its current content, so unsaved or unstaged edits are reported as not committed. A .git-blame-ignore-revs file at the toplevel is honoured."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<line>", "1-based line number"},
            {"-w", "Ignore whitespace-only changes"}
        };
    }
};

}
