#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Git.hpp"
#include "util/Expected.hpp"

namespace linetrack {

/**
 * @brief Handle on one git repository
 *
 * Holds the working tree root (toplevel), the metadata directory (gitdir),
 * a short label for the checked-out ref and the configured user name.
 * toplevel and gitdir are resolved together once; the head label can be
 * refreshed on its own (e.g. after a checkout).
 *
 * Label rules:
 *   - branch checked out     -> branch name ("main")
 *   - detached HEAD          -> short commit hash ("1a2b3c4")
 *   - no commits yet         -> ""
 *   - rebase in progress     -> any of the above + "(rebasing)"
 */
class Repository {
public:
    /**
     * @brief Resolve the repository containing `dir`
     * @param git Capability object; must outlive the repository
     * @param dir Directory to resolve from (usually the file's parent)
     * @return Repository, or NotARepository
     *
     * When git finds nothing and the yadm fallback is enabled, a directory
     * under $HOME that yadm tracks is resolved through yadm instead.
     */
    static Expected<Repository> resolve(const Git& git, const std::filesystem::path& dir);

    const std::filesystem::path& toplevel() const { return top; }
    const std::filesystem::path& gitdir() const { return gitDir; }
    const std::string& abbrevHead() const { return head; }
    const std::string& username() const { return user; }

    /// True when resolved through the fallback dotfile tool
    bool detached() const { return isDetached; }

    const Git& git() const { return *gitCaps; }

    /// Recompute abbrevHead() without re-resolving toplevel/gitdir
    Expected<void> refreshHead();

    /// Run git against this repository (cwd = toplevel, --git-dir set)
    Expected<CommandResult> command(const std::vector<std::string>& args, CommandOptions opts = {}) const;

    /// Paths (relative to toplevel) whose working tree differs from the index
    Expected<std::vector<std::string>> filesChanged() const;

    /**
     * @brief Content of `object` ("<rev>:<path>", ":<path>" for the index)
     *
     * Lines are converted from `encoding` to UTF-8 unless it already is UTF-8.
     * A missing object yields an empty sequence.
     */
    Expected<std::vector<std::string>> getShowText(const std::string& object, const std::string& encoding) const;

private:
    explicit Repository(const Git& git) : gitCaps(&git) {}

    const Git* gitCaps;
    std::filesystem::path top{};
    std::filesystem::path gitDir{};
    std::string head{};
    std::string user{};
    bool isDetached{false};
};

/**
 * @brief Shares one Repository per metadata directory
 *
 * FileObjects keep plain references into the cache, so it must outlive them.
 */
class RepositoryCache {
public:
    explicit RepositoryCache(const Git& git) : git(git) {}
    RepositoryCache(const RepositoryCache&) = delete;
    RepositoryCache& operator=(const RepositoryCache&) = delete;

    /// Repository containing `dir`, resolving it on first use
    Expected<Repository*> open(const std::filesystem::path& dir);

    size_t size() const;

private:
    const Git& git;
    mutable std::mutex mtx;
    std::map<std::filesystem::path, std::unique_ptr<Repository>> byGitdir;
    std::map<std::filesystem::path, Repository*> byDir;
};

}
