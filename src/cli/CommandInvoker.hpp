#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace linetrack {

/**
 * @brief Runs a command and reports its failure
 *
 * With a scheduler in the context the command body runs as one task, so its
 * git invocations only suspend that task.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
