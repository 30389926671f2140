#include "core/Diff.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace linetrack {

namespace Diff {

namespace {

/// mkstemp-backed file removed on scope exit
class TempFile {
public:
    TempFile() = default;
    ~TempFile() {
        if (!filePath.empty()) {
            std::error_code ec;
            fs::remove(filePath, ec);
        }
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    Expected<void> write(const std::vector<std::string>& lines) {
        std::string tmpl = (fs::temp_directory_path() / "linetrack_diff_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        int fd = ::mkstemp(buf.data());
        if (fd < 0) {
            return Error{ErrorCode::IoError, std::string("mkstemp failed: ") + std::strerror(errno)};
        }
        ::close(fd);
        filePath = buf.data();

        std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
        for (const auto& l : lines) out << l << '\n';
        out.flush();
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to write " + filePath.string()};
        }
        return {};
    }

    const fs::path& path() const { return filePath; }

private:
    fs::path filePath;
};

}

Expected<std::vector<Hunk>> run(const Git& git, const std::vector<std::string>& oldLines,
                                const std::vector<std::string>& newLines) {
    TempFile oldFile, newFile;
    if (auto r = oldFile.write(oldLines); !r) return r.error();
    if (auto r = newFile.write(newLines); !r) return r.error();

    const auto& cfg = git.config();
    auto res = git.command({"-c", "core.safecrlf=false", "diff", "--no-index", "--color=never",
                            cfg.indentHeuristic ? "--indent-heuristic" : "--no-indent-heuristic",
                            "--diff-algorithm=" + cfg.diffAlgorithm, "--patch-with-raw", "--unified=0",
                            oldFile.path().string(), newFile.path().string()},
                           CommandOptions{"", fs::temp_directory_path(), std::nullopt, false});
    if (!res) return res.error();
    return Hunks::parseDiff(res.value().lines);
}

}

}
