#pragma once

#include "cli/ICommand.hpp"

namespace linetrack {

class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "Show help for linetrack commands"; }
    const char* helpNameLine() const override { return "help -  Display help information about linetrack"; }
    const char* helpSynopsis() const override { return "linetrack help [<command>]"; }
    const char* helpDescription() const override { return "With no arguments, list the available commands. With a command name, show its usage and options."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<command>", "Command to describe"} };
    }
};

}
