#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace linetrack {

/**
 * @brief One line of `git blame --line-porcelain`
 *
 * Header fields are always present. Keyed fields are filled only when blame
 * printed them; unrecognised keys land in `extra` (keys normalised with
 * '-' -> '_'). Produced fresh per query and never cached.
 */
struct BlameInfo {
    std::string sha;
    std::string abbrevSha;
    int origLnum{0};
    int finalLnum{0};

    std::optional<std::string> author;
    std::optional<std::string> authorMail;
    std::optional<int64_t> authorTime;
    std::optional<std::string> authorTz;
    std::optional<std::string> committer;
    std::optional<std::string> committerMail;
    std::optional<int64_t> committerTime;
    std::optional<std::string> committerTz;
    std::optional<std::string> summary;
    std::optional<std::string> filename;
    std::optional<std::string> previous;
    std::optional<std::string> previousSha;
    std::optional<std::string> previousFilename;
    bool boundary{false};

    std::map<std::string, std::string> extra;
};

namespace Blame {

/**
 * @brief Parse porcelain output for a single line
 *
 * First line: "<sha> <orig-lnum> <final-lnum> [<count>]". Following lines
 * are "key value" pairs; lines starting with a tab are file content and are
 * skipped. Returns nullopt for empty output.
 */
std::optional<BlameInfo> parsePorcelain(const std::vector<std::string>& lines);

/// Placeholder for lines that have no commit yet
BlameInfo notCommitted(int lineNumber);

}

}
