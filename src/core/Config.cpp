#include "core/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "util/Logger.hpp"

namespace linetrack {

static std::string lowercase(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

static bool parseFlag(const char* name, bool fallback) {
    const char* env = std::getenv(name);
    if (!env) return fallback;
    std::string v = lowercase(env);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    Logger::instance().warn(std::string("Ignoring invalid value for ") + name + ": " + env);
    return fallback;
}

Config Config::fromEnvironment() {
    Config cfg;
    if (const char* v = std::getenv("LINETRACK_GIT_VERSION"); v && *v) {
        cfg.gitVersion = v;
    }
    cfg.yadmEnabled = parseFlag("LINETRACK_YADM", cfg.yadmEnabled);
    if (const char* home = std::getenv("HOME"); home && *home) {
        cfg.homeDir = home;
    }
    if (const char* algo = std::getenv("LINETRACK_DIFF_ALGORITHM"); algo && *algo) {
        std::string a = lowercase(algo);
        if (a == "myers" || a == "minimal" || a == "patience" || a == "histogram") {
            cfg.diffAlgorithm = a;
        } else {
            Logger::instance().warn("Unknown diff algorithm '" + a + "', using myers");
        }
    }
    cfg.indentHeuristic = parseFlag("LINETRACK_INDENT_HEURISTIC", cfg.indentHeuristic);
    return cfg;
}

}
