#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class ShowCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "show"; }
    const char* description() const override { return "Print a file's content at a revision"; }
    const char* helpNameLine() const override { return "show -  Print the blob recorded for a file"; }
    const char* helpSynopsis() const override { return "linetrack show <file> [<revision>]"; }
    const char* helpDescription() const override { return "Print the content of <file> as stored at <revision>. Without a revision the staged (index) copy is printed. Line endings follow the working copy."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<file>", "File to print"},
            {"<revision>", "Commit-ish such as HEAD or HEAD~2 (default: the index)"}
        };
    }
};

}
