#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class InfoCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "info"; }
    const char* description() const override { return "Show repository and index state of a file"; }
    const char* helpNameLine() const override { return "info -  Show what the index knows about a file"; }
    const char* helpSynopsis() const override { return "linetrack info <file>"; }
    const char* helpDescription() const override { return "Resolve the repository containing <file> and print its toplevel, git dir, head label and user, followed by the file's index entry: blob, mode, conflict state and line endings."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<file>", "File to inspect"} };
    }
};

}
