#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class ChangedCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "changed"; }
    const char* description() const override { return "List files modified in the working tree"; }
    const char* helpNameLine() const override { return "changed -  List paths whose working tree differs from the index"; }
    const char* helpSynopsis() const override { return "linetrack changed [<dir>]"; }
    const char* helpDescription() const override { return "Print, relative to the repository toplevel, every path whose working tree copy differs from the index. Submodules are ignored."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<dir>", "Directory inside the repository (default: current directory)"} };
    }
};

}
