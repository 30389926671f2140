#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Blame.hpp"
#include "core/Hunks.hpp"
#include "core/Repository.hpp"
#include "util/Expected.hpp"

namespace linetrack {

/**
 * @brief Index snapshot for one file
 *
 * objectName unset means the file is untracked. While hasConflicts is set
 * objectName stays unset; the common ancestor (stage 1), when there is one,
 * is kept in ancestorObjectName and modeBits.
 */
struct FileProps {
    std::string relpath;
    std::optional<std::string> origRelpath;
    std::optional<std::string> objectName;
    std::optional<std::string> ancestorObjectName;
    std::optional<std::string> modeBits;
    bool hasConflicts{false};
    bool iCrlf{false};
    bool wCrlf{false};
};

/**
 * @brief One attached file and the index operations on it
 *
 * Owned by whoever attached to the file. The Repository is shared and must
 * outlive this object.
 */
class FileObject {
public:
    /**
     * @brief Attach to `file`
     * @param file Absolute path of the file
     * @param encoding Encoding of the file's text ("utf-8" for none)
     * @param cache Repository cache to resolve and share the repository
     * @param silent Don't report stderr while reading the first snapshot
     * @return FileObject, InsideGitDir for paths with a ".git" component,
     *         or NotARepository
     */
    static Expected<FileObject> open(const std::filesystem::path& file, const std::string& encoding,
                                     RepositoryCache& cache, bool silent = false);

    FileObject(Repository& repo, std::filesystem::path file, std::string encoding);

    Repository& repository() const { return *repo; }
    const std::filesystem::path& file() const { return filePath; }
    const std::string& encoding() const { return fileEncoding; }
    const FileProps& props() const { return state; }

    /// Parse `ls-files --stage --others --eol` lines for a single path
    static FileProps parseFileInfo(const std::vector<std::string>& lines);

    /// Read the index/working-tree snapshot of `file` (default: this file)
    Expected<FileProps> fileInfo(const std::optional<std::filesystem::path>& file = std::nullopt,
                                 bool silent = false) const;

    /**
     * @brief Refresh the snapshot from the index
     * @param updateRelpath Also take relpath from the listing
     * @return true if the blob hash changed since the last snapshot
     */
    Expected<bool> updateFileInfo(bool updateRelpath = false, bool silent = false);

    /**
     * @brief Make sure the index has an entry patches can apply to
     *
     * Untracked files are added with --intent-to-add; conflicted files get
     * their entry reset to the common ancestor. No-op otherwise.
     */
    Expected<void> ensureFileInIndex();

    /// Replace the staged content with `lines`
    Expected<void> stageLines(const std::vector<std::string>& lines);

    /// Apply `hunks` to the index only; `invert` un-stages them
    Expected<void> stageHunks(const std::vector<Hunk>& hunks, bool invert = false);

    /// Reset the index entry to its committed state
    Expected<void> unstageFile();

    /// Content of "<revision>:<relpath>" ("" = index), CRs matched to the working copy
    Expected<std::vector<std::string>> getShowText(const std::string& revision) const;

    /**
     * @brief Blame one line of `lines` (the live buffer content)
     * @return Blame record, the not-committed placeholder for untracked files
     *         or repositories without commits, or nullopt when blame printed
     *         nothing (e.g. line out of range)
     */
    Expected<std::optional<BlameInfo>> runBlame(const std::vector<std::string>& lines, int lineNumber,
                                                bool ignoreWhitespace) const;

    /// New relpath if the staged changes rename this file, else nullopt
    Expected<std::optional<std::string>> hasMoved();

    /// Give a file the index no longer lists (e.g. renamed away) its old index path
    void assumeRelpath(std::string relpath) { state.relpath = std::move(relpath); }

private:
    Expected<CommandResult> command(const std::vector<std::string>& args, CommandOptions opts = {}) const;

    Repository* repo;
    std::filesystem::path filePath;
    std::string fileEncoding;
    FileProps state;
};

}
