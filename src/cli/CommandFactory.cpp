#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/BlameCommand.hpp"
#include "cli/commands/ChangedCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InfoCommand.hpp"
#include "cli/commands/MovedCommand.hpp"
#include "cli/commands/ShowCommand.hpp"
#include "cli/commands/StageBufferCommand.hpp"
#include "cli/commands/StageCommand.hpp"
#include "cli/commands/UnstageCommand.hpp"

namespace linetrack {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerBuiltins() {
    registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    registerCreator("info", [] { return std::make_unique<InfoCommand>(); });
    registerCreator("changed", [] { return std::make_unique<ChangedCommand>(); });
    registerCreator("show", [] { return std::make_unique<ShowCommand>(); });
    registerCreator("blame", [] { return std::make_unique<BlameCommand>(); });
    registerCreator("stage", [] { return std::make_unique<StageCommand>(); });
    registerCreator("stage-buffer", [] { return std::make_unique<StageBufferCommand>(); });
    registerCreator("unstage", [] { return std::make_unique<UnstageCommand>(); });
    registerCreator("moved", [] { return std::make_unique<MovedCommand>(); });
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

}
