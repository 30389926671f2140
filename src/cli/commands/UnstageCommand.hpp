#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class UnstageCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "unstage"; }
    const char* description() const override { return "Unstage a file or its staged hunks"; }
    const char* helpNameLine() const override { return "unstage -  Undo staging for a file"; }
    const char* helpSynopsis() const override { return "linetrack unstage <file> [--hunks]"; }
    const char* helpDescription() const override { return "Reset the index entry of <file> to the committed version. With --hunks the staged hunks are reverse-applied to the index instead, which also works for partially staged conflict resolutions."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--hunks", "Reverse-apply the hunks between HEAD and the index"} };
    }
};

}
