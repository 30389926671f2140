#pragma once

#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Git.hpp"
#include "core/Repository.hpp"
#include "core/Scheduler.hpp"
#include "util/Expected.hpp"

namespace linetrack {

/// Services shared by all commands; built once in main()
struct AppContext {
    Config config{};
    const Git* git{nullptr};
    RepositoryCache* repos{nullptr};
    Scheduler* scheduler{nullptr};      // commands run as a task when set
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
