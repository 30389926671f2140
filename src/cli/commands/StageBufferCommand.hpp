#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class StageBufferCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "stage-buffer"; }
    const char* description() const override { return "Replace the staged content of a file"; }
    const char* helpNameLine() const override { return "stage-buffer -  Stage given content wholesale for a file"; }
    const char* helpSynopsis() const override { return "linetrack stage-buffer <file> [<source>]"; }
    const char* helpDescription() const override { return "Write the lines of <source> as a new blob and point the index entry of <file> at it. The working tree is left alone. Without <source>, the working copy of <file> is staged."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<file>", "File whose index entry is replaced"},
            {"<source>", "File providing the new content (default: <file>)"}
        };
    }
};

}
