#pragma once

#include <filesystem>
#include <string>

namespace linetrack {

/**
 * @brief Runtime settings, read once at startup
 *
 * Environment:
 *   LINETRACK_GIT_VERSION       "auto" (probe `git --version`) or a version string
 *   LINETRACK_YADM              1/true/yes enables the yadm fallback
 *   LINETRACK_DIFF_ALGORITHM    myers|minimal|patience|histogram
 *   LINETRACK_INDENT_HEURISTIC  0/false/no disables --indent-heuristic
 *   HOME                        home directory for the yadm fallback
 * Log level is read by the Logger itself (LINETRACK_LOG).
 */
struct Config {
    std::string gitCommand{"git"};
    std::string gitVersion{"auto"};
    bool yadmEnabled{false};
    std::string yadmCommand{"yadm"};
    std::filesystem::path homeDir{};
    std::string diffAlgorithm{"myers"};
    bool indentHeuristic{true};

    static Config fromEnvironment();
};

}
