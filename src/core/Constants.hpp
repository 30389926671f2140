#pragma once

#include <cstddef>

/**
 * @brief Git-facing constants used throughout the codebase
 *
 * Centralizes magic strings and numbers to improve maintainability and readability.
 */
namespace linetrack {

namespace Constants {
    // Blame
    constexpr size_t ABBREV_SHA_LENGTH = 8;                       // abbrev_sha = first 8 chars of sha
    constexpr const char* NULL_SHA = "0000000000000000000000000000000000000000";
    constexpr const char* NOT_COMMITTED_NAME = "Not Committed Yet";
    constexpr const char* NOT_COMMITTED_MAIL = "<not.committed.yet>";
    constexpr const char* BLAME_IGNORE_REVS_FILE = ".git-blame-ignore-revs";

    // Repository layout
    constexpr const char* GIT_DIR_NAME = ".git";
    constexpr const char* REBASE_MERGE_DIR = "rebase-merge";
    constexpr const char* REBASE_APPLY_DIR = "rebase-apply";
    constexpr const char* REBASING_SUFFIX = "(rebasing)";
    constexpr const char* DETACHED_HEAD = "HEAD";

    // Index
    constexpr const char* DEFAULT_MODE_BITS = "100644";           // Regular file (-rw-r--r--)

    // ls-files --others probing a path whose directory vanished
    constexpr const char* BENIGN_LS_FILES_STDERR = "warning: could not open directory ";
    constexpr const char* NO_SUCH_FILE_SUFFIX = ": No such file or directory";

    // Version gates
    constexpr int ABSOLUTE_GIT_DIR_MAJOR = 2;                     // rev-parse --absolute-git-dir
    constexpr int ABSOLUTE_GIT_DIR_MINOR = 13;
}

}
