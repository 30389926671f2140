#include "core/Repository.hpp"

#include "core/Constants.hpp"
#include "util/Encoding.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace fs = std::filesystem;

namespace linetrack {

namespace {

struct RepoInfo {
    fs::path toplevel;
    fs::path gitdir;
    std::string abbrevHead;
};

/**
 * @brief Turn the raw --abbrev-ref output into a display label
 *
 * "HEAD" means detached or unborn; the short hash is asked for separately
 * and comes back empty when there are no commits.
 */
Expected<std::string> processAbbrevHead(const Git& git, const fs::path& gitdir, const std::string& headStr,
                                        const fs::path& cwd, const std::string& tool) {
    std::string label = headStr;
    if (headStr == Constants::DETACHED_HEAD) {
        auto res = git.command({"rev-parse", "--short", "HEAD"},
                               CommandOptions{tool, cwd, std::nullopt, true});
        if (!res) return res.error();
        label = res.value().lines.empty() ? "" : res.value().lines.front();
    }
    std::error_code ec;
    if (fs::exists(gitdir / Constants::REBASE_MERGE_DIR, ec) || fs::exists(gitdir / Constants::REBASE_APPLY_DIR, ec)) {
        label += Constants::REBASING_SUFFIX;
    }
    return label;
}

/// One rev-parse call answering toplevel, gitdir and head label together
Expected<RepoInfo> queryRepoInfo(const Git& git, const fs::path& dir, const std::string& tool) {
    const bool absGitDir = git.hasAbsoluteGitDir();
    auto res = git.command({"rev-parse", "--show-toplevel", absGitDir ? "--absolute-git-dir" : "--git-dir",
                            "--abbrev-ref", "HEAD"},
                           CommandOptions{tool, dir, std::nullopt, true});
    if (!res) return res.error();

    const auto& lines = res.value().lines;
    RepoInfo info;
    if (lines.size() >= 2 && !lines[1].empty()) {
        info.toplevel = fs::path(lines[0]).lexically_normal();
        info.gitdir = fs::path(lines[1]);
        if (!absGitDir) {
            std::error_code ec;
            fs::path resolved = fs::canonical(info.gitdir.is_absolute() ? info.gitdir : dir / info.gitdir, ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Cannot resolve git dir " + info.gitdir.string() + ": " + ec.message()};
            }
            info.gitdir = resolved;
        }
        info.gitdir = info.gitdir.lexically_normal();
    }
    if (info.gitdir.empty()) {
        return info;
    }

    auto label = processAbbrevHead(git, info.gitdir, lines.size() >= 3 ? lines[2] : "", dir, tool);
    if (!label) return label.error();
    info.abbrevHead = label.value();
    return info;
}

bool isUnder(const fs::path& path, const fs::path& base) {
    if (base.empty()) return false;
    auto rel = path.lexically_normal().lexically_relative(base.lexically_normal());
    return !rel.empty() && *rel.begin() != "..";
}

}

Expected<Repository> Repository::resolve(const Git& git, const fs::path& dir) {
    auto info = queryRepoInfo(git, dir, "");
    if (!info) return info.error();

    Repository repo(git);
    const auto& cfg = git.config();

    if (info.value().gitdir.empty() && cfg.yadmEnabled && isUnder(dir, cfg.homeDir)) {
        auto tracked = git.command({"ls-files", dir.string()},
                                   CommandOptions{cfg.yadmCommand, dir, std::nullopt, true});
        if (tracked && !tracked.value().lines.empty()) {
            Logger::instance().debug("Resolving " + dir.string() + " through " + cfg.yadmCommand);
            info = queryRepoInfo(git, dir, cfg.yadmCommand);
            if (!info) return info.error();
            repo.isDetached = true;
        }
    }

    if (info.value().gitdir.empty()) {
        return Error{ErrorCode::NotARepository, "Not in a git repository: " + dir.string()};
    }

    repo.top = info.value().toplevel;
    repo.gitDir = info.value().gitdir;
    repo.head = info.value().abbrevHead;

    auto name = git.command({"config", "user.name"}, CommandOptions{"", dir, std::nullopt, true});
    if (name && !name.value().lines.empty()) {
        repo.user = name.value().lines.front();
    }
    return repo;
}

Expected<void> Repository::refreshHead() {
    auto res = command({"rev-parse", "--abbrev-ref", "HEAD"}, CommandOptions{"", {}, std::nullopt, true});
    if (!res) return res.error();
    const std::string headStr = res.value().lines.empty() ? "" : res.value().lines.front();

    // processAbbrevHead may run rev-parse --short from toplevel
    auto label = processAbbrevHead(*gitCaps, gitDir, headStr, top,
                                   isDetached ? gitCaps->config().yadmCommand : "");
    if (!label) return label.error();
    head = label.value();
    return {};
}

Expected<CommandResult> Repository::command(const std::vector<std::string>& args, CommandOptions opts) const {
    std::vector<std::string> full = {"--git-dir", gitDir.string()};
    if (isDetached) {
        full.push_back("--work-tree");
        full.push_back(top.string());
    }
    full.insert(full.end(), args.begin(), args.end());
    opts.command.clear();
    opts.cwd = top;
    return gitCaps->command(full, opts);
}

Expected<std::vector<std::string>> Repository::filesChanged() const {
    auto res = command({"status", "--porcelain", "--ignore-submodules"});
    if (!res) return res.error();

    std::vector<std::string> changed;
    for (const auto& line : res.value().lines) {
        // "XY path": Y is the working tree column
        if (line.size() > 3 && line[1] == 'M') {
            // Renames are "R  old -> new"
            std::string path = line.substr(3);
            const auto arrow = path.find(" -> ");
            if (arrow != std::string::npos) path = path.substr(arrow + 4);
            changed.push_back(path);
        }
    }
    return changed;
}

Expected<std::vector<std::string>> Repository::getShowText(const std::string& object, const std::string& encoding) const {
    auto res = command({"show", object}, CommandOptions{"", {}, std::nullopt, true});
    if (!res) return res.error();
    if (Encoding::isUtf8(encoding)) {
        return res.value().lines;
    }
    return Encoding::toUtf8(res.value().lines, encoding);
}

Expected<Repository*> RepositoryCache::open(const fs::path& dir) {
    const fs::path key = dir.lexically_normal();
    {
        std::scoped_lock lock(mtx);
        auto it = byDir.find(key);
        if (it != byDir.end()) return it->second;
    }

    // Resolution runs processes; don't hold the lock across it
    auto res = Repository::resolve(git, key);
    if (!res) return res.error();

    std::scoped_lock lock(mtx);
    auto& slot = byGitdir[res.value().gitdir()];
    if (!slot) {
        slot = std::make_unique<Repository>(std::move(res.value()));
        Logger::instance().debug("New repository " + slot->toplevel().string());
    }
    byDir[key] = slot.get();
    return slot.get();
}

size_t RepositoryCache::size() const {
    std::scoped_lock lock(mtx);
    return byGitdir.size();
}

}
