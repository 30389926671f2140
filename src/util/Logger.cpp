#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace linetrack {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("LINETRACK_LOG");
    if (!env) return LogLevel::Info;
    std::string v(env);
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Info;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) {
    std::scoped_lock lock(mtx);
    currentLevel = level;
}

LogLevel Logger::level() const {
    std::scoped_lock lock(mtx);
    return currentLevel;
}

void Logger::setSink(Sink s) {
    std::scoped_lock lock(mtx);
    sink = std::move(s);
}

void Logger::emit(LogLevel lvl, const std::string& msg) const {
    Sink target;
    {
        std::scoped_lock lock(mtx);
        if (currentLevel < lvl) return;
        target = sink;
    }
    if (target) {
        target(lvl, msg);
        return;
    }
    std::scoped_lock lock(mtx);
    switch (lvl) {
        case LogLevel::Error: std::cerr << "[error] " << msg << "\n"; break;
        case LogLevel::Warn:  std::cerr << "[warn ] " << msg << "\n"; break;
        case LogLevel::Info:  std::cout << "[info ] " << msg << "\n"; break;
        case LogLevel::Debug: std::cout << "[debug] " << msg << "\n"; break;
    }
}

void Logger::error(const std::string& msg) const { emit(LogLevel::Error, msg); }
void Logger::warn(const std::string& msg) const { emit(LogLevel::Warn, msg); }
void Logger::info(const std::string& msg) const { emit(LogLevel::Info, msg); }
void Logger::debug(const std::string& msg) const { emit(LogLevel::Debug, msg); }

}
