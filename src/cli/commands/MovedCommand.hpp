#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class MovedCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "moved"; }
    const char* description() const override { return "Report a staged rename of a file"; }
    const char* helpNameLine() const override { return "moved -  Detect whether a file was renamed in the index"; }
    const char* helpSynopsis() const override { return "linetrack moved <file>"; }
    const char* helpDescription() const override { return "Look for <file> as the origin of a rename among the staged changes and print its new path."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
