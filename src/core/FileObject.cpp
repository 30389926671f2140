#include "core/FileObject.hpp"

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace fs = std::filesystem;

namespace linetrack {

namespace {

bool inGitDir(const fs::path& file) {
    for (const auto& part : file) {
        if (part == Constants::GIT_DIR_NAME) return true;
    }
    return false;
}

/// ls-files --others on a path whose directory is gone
bool isBenignLsFilesError(const std::string& err) {
    return StringUtils::startsWith(err, Constants::BENIGN_LS_FILES_STDERR) &&
           err.find(Constants::NO_SUCH_FILE_SUFFIX) != std::string::npos;
}

void parseEol(const std::string& field, FileProps& props) {
    auto eol = StringUtils::splitWhitespace(field);
    props.iCrlf = !eol.empty() && eol[0] == "i/crlf";
    props.wCrlf = eol.size() > 1 && eol[1] == "w/crlf";
}

}

FileObject::FileObject(Repository& repo, fs::path file, std::string encoding)
    : repo(&repo), filePath(std::move(file)), fileEncoding(std::move(encoding)) {}

Expected<FileObject> FileObject::open(const fs::path& file, const std::string& encoding, RepositoryCache& cache,
                                      bool silent) {
    if (inGitDir(file)) {
        return Error{ErrorCode::InsideGitDir, "Path is inside a git directory: " + file.string()};
    }

    auto repoRes = cache.open(file.parent_path());
    if (!repoRes) return repoRes.error();

    FileObject obj(*repoRes.value(), file, encoding);
    auto upd = obj.updateFileInfo(true, silent);
    if (!upd) return upd.error();
    return obj;
}

Expected<CommandResult> FileObject::command(const std::vector<std::string>& args, CommandOptions opts) const {
    return repo->command(args, std::move(opts));
}

FileProps FileObject::parseFileInfo(const std::vector<std::string>& lines) {
    FileProps props;
    for (const auto& line : lines) {
        auto parts = StringUtils::split(line, '\t');
        if (parts.size() > 2) {
            // "<mode> <hash> <stage>\t<eol info>\t<relpath>"
            parseEol(parts[1], props);
            props.relpath = parts[2];

            auto attrs = StringUtils::splitWhitespace(parts[0]);
            if (attrs.size() < 3) continue;
            int stage = 0;
            try {
                stage = std::stoi(attrs[2]);
            } catch (const std::exception&) {
                Logger::instance().warn("Unexpected ls-files line: " + line);
                continue;
            }

            if (stage == 0) {
                props.modeBits = attrs[0];
                props.objectName = attrs[1];
            } else if (stage == 1) {
                props.modeBits = attrs[0];
                props.ancestorObjectName = attrs[1];
            } else {
                props.hasConflicts = true;
            }
        } else if (parts.size() == 2) {
            // Untracked: "<eol info>\t<relpath>"
            parseEol(parts[0], props);
            props.relpath = parts[1];
        }
    }

    if (props.hasConflicts) {
        props.objectName.reset();
    } else if (!props.objectName && props.ancestorObjectName) {
        props.objectName = props.ancestorObjectName;
        props.ancestorObjectName.reset();
    }
    return props;
}

Expected<FileProps> FileObject::fileInfo(const std::optional<fs::path>& file, bool silent) const {
    const fs::path target = file.value_or(filePath);
    auto res = command({"-c", "core.quotepath=off", "ls-files", "--stage", "--others", "--exclude-standard", "--eol",
                        target.string()},
                       CommandOptions{"", {}, std::nullopt, true});
    if (!res) return res.error();

    const std::string& err = res.value().stderrText;
    if (!err.empty() && !silent && !isBenignLsFilesError(err)) {
        Logger::instance().warn("ls-files: " + StringUtils::trim(err));
    }
    return parseFileInfo(res.value().lines);
}

Expected<bool> FileObject::updateFileInfo(bool updateRelpath, bool silent) {
    const auto oldObjectName = state.objectName;

    auto res = fileInfo(filePath, silent);
    if (!res) return res.error();
    const FileProps& props = res.value();

    if (updateRelpath) {
        state.relpath = props.relpath;
    }
    state.objectName = props.objectName;
    state.ancestorObjectName = props.ancestorObjectName;
    state.modeBits = props.modeBits;
    state.hasConflicts = props.hasConflicts;
    state.iCrlf = props.iCrlf;
    state.wCrlf = props.wCrlf;

    return oldObjectName != state.objectName;
}

Expected<void> FileObject::ensureFileInIndex() {
    if (state.objectName && !state.hasConflicts) {
        return {};
    }

    if (!state.hasConflicts) {
        auto res = command({"add", "--intent-to-add", filePath.string()});
        if (!res) return res.error();
    } else {
        // Staging is always done relative to the common ancestor
        if (!state.ancestorObjectName || !state.modeBits) {
            return Error{ErrorCode::CommandFailed, "No common ancestor in the index for " + state.relpath};
        }
        const std::string info = *state.modeBits + "," + *state.ancestorObjectName + "," + state.relpath;
        auto res = command({"update-index", "--add", "--cacheinfo", info});
        if (!res) return res.error();
    }

    auto upd = updateFileInfo();
    if (!upd) return upd.error();
    return {};
}

Expected<void> FileObject::stageLines(const std::vector<std::string>& lines) {
    if (state.relpath.empty()) {
        return Error{ErrorCode::InvalidArgs, "No index path known for " + filePath.string()};
    }

    auto hashed = command({"hash-object", "-w", "--stdin"}, CommandOptions{"", {}, lines, false});
    if (!hashed) return hashed.error();
    if (hashed.value().lines.empty()) {
        return Error{ErrorCode::CommandFailed, "hash-object returned no object for " + state.relpath};
    }
    const std::string& newObject = hashed.value().lines.front();

    const std::string info = state.modeBits.value_or(Constants::DEFAULT_MODE_BITS) + "," + newObject + "," + state.relpath;
    auto res = command({"update-index", "--add", "--cacheinfo", info});
    if (!res) return res.error();
    if (res.value().exitCode != 0) {
        return Error{ErrorCode::CommandFailed, "update-index failed for " + state.relpath};
    }
    return {};
}

Expected<void> FileObject::stageHunks(const std::vector<Hunk>& hunks, bool invert) {
    if (hunks.empty()) return {};

    auto ensured = ensureFileInIndex();
    if (!ensured) return ensured;

    auto patch = Hunks::createPatch(state.relpath, hunks, state.modeBits.value_or(Constants::DEFAULT_MODE_BITS), invert);
    if (!state.iCrlf && state.wCrlf) {
        for (auto& line : patch) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
        }
    }

    auto res = command({"apply", "--whitespace=nowarn", "--cached", "--unidiff-zero", "-"},
                       CommandOptions{"", {}, patch, false});
    if (!res) return res.error();
    if (res.value().exitCode != 0) {
        return Error{ErrorCode::CommandFailed, "git apply rejected the patch for " + state.relpath};
    }
    return {};
}

Expected<void> FileObject::unstageFile() {
    auto res = command({"reset", "--quiet", "--", filePath.string()});
    if (!res) return res.error();
    return {};
}

Expected<std::vector<std::string>> FileObject::getShowText(const std::string& revision) const {
    if (state.relpath.empty()) {
        return std::vector<std::string>{};
    }

    auto res = repo->getShowText(revision + ":" + state.relpath, fileEncoding);
    if (!res) return res.error();

    std::vector<std::string> lines = std::move(res.value());
    if (!state.iCrlf && state.wCrlf) {
        for (auto& line : lines) line += '\r';
    }
    return lines;
}

Expected<std::optional<BlameInfo>> FileObject::runBlame(const std::vector<std::string>& lines, int lineNumber,
                                                        bool ignoreWhitespace) const {
    // Untracked file or no commits yet: nothing to ask git about
    if ((!state.objectName && !state.hasConflicts) || repo->abbrevHead().empty()) {
        return std::optional<BlameInfo>(Blame::notCommitted(lineNumber));
    }

    std::vector<std::string> args = {"blame", "--contents", "-", "-L", std::to_string(lineNumber) + ",+1",
                                     "--line-porcelain", filePath.string()};
    if (ignoreWhitespace) {
        args.push_back("-w");
    }
    const fs::path ignoreFile = repo->toplevel() / Constants::BLAME_IGNORE_REVS_FILE;
    std::error_code ec;
    if (fs::exists(ignoreFile, ec)) {
        args.push_back("--ignore-revs-file");
        args.push_back(ignoreFile.string());
    }

    auto res = command(args, CommandOptions{"", {}, lines, false});
    if (!res) return res.error();
    return Blame::parsePorcelain(res.value().lines);
}

Expected<std::optional<std::string>> FileObject::hasMoved() {
    auto res = command({"diff", "--name-status", "-C", "--cached"});
    if (!res) return res.error();

    const std::string origRelpath = state.origRelpath.value_or(state.relpath);
    std::optional<std::string> moved;
    for (const auto& line : res.value().lines) {
        // "R100\t<orig>\t<new>"; copies ("C<score>") leave the original in place
        auto parts = StringUtils::split(line, '\t');
        if (parts.size() != 3 || !StringUtils::startsWith(parts[0], "R") || parts[1] != origRelpath) continue;
        if (moved) {
            Logger::instance().debug("Ignoring further rename of " + origRelpath + " to " + parts[2]);
            continue;
        }
        moved = parts[2];
    }

    if (moved) {
        state.origRelpath = origRelpath;
        state.relpath = *moved;
        filePath = repo->toplevel() / *moved;
    }
    return moved;
}

}
