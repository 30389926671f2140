#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class StageCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "stage"; }
    const char* description() const override { return "Stage hunks of a file"; }
    const char* helpNameLine() const override { return "stage -  Stage changed hunks without touching the working tree"; }
    const char* helpSynopsis() const override { return "linetrack stage <file> [-L <start>,<end>]"; }
    const char* helpDescription() const override { return "Diff the staged copy of <file> against its working copy and apply the resulting hunks to the index only. With -L, only hunks touching the given working-copy lines are staged. Untracked files are first added with --intent-to-add."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"-L <start>,<end>", "Stage only hunks intersecting lines <start>..<end> (1-based, inclusive)"} };
    }
};

}
