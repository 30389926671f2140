#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace linetrack {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide diagnostic channel
 *
 * Records below the current level are dropped. Without a sink, errors and
 * warnings go to stderr and the rest to stdout. An embedding tool installs a
 * sink to receive records (e.g. stderr of a git command) itself.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Route records to `sink`; an empty sink restores console output
    void setSink(Sink sink);

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void emit(LogLevel level, const std::string& msg) const;

    LogLevel currentLevel;
    Sink sink;
    mutable std::mutex mtx;
};

}
