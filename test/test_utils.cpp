#include "test_utils.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace linetrack::test::utils {

fs::path createTempDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string dirname = "linetrack_test_";
    for (int i = 0; i < 8; ++i) {
        dirname += "0123456789abcdef"[dis(gen)];
    }

    fs::path tempDir = fs::temp_directory_path() / dirname;
    fs::create_directories(tempDir);
    // git reports resolved paths; /tmp may be a symlink
    return fs::canonical(tempDir);
}

void removeDir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
}

fs::path createFile(
    const fs::path& baseDir,
    const std::string& filename,
    const std::string& content
) {
    fs::path filePath = baseDir / filename;

    // Create parent directories if needed
    fs::create_directories(filePath.parent_path());

    std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    file << content;
    file.close();

    return filePath;
}

std::string readFile(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

fs::path getCwd() {
    return fs::current_path();
}

void setCwd(const fs::path& dir) {
    fs::current_path(dir);
}

bool gitAvailable() {
    static const bool available = [] {
        ProcessRunner runner;
        JobSpec spec;
        spec.command = "git";
        spec.args = {"--version"};
        spec.suppressStderr = true;
        auto res = runner.run(spec);
        return res && res.value().exitCode == 0;
    }();
    return available;
}

CommandResult git(const fs::path& dir, const std::vector<std::string>& args, const std::vector<std::string>& input) {
    ProcessRunner runner;
    JobSpec spec;
    spec.command = "git";
    spec.args = args;
    spec.cwd = dir;
    spec.suppressStderr = true;
    if (!input.empty()) spec.inputLines = input;
    auto res = runner.run(spec);
    if (!res) {
        CommandResult failed;
        failed.stderrText = res.error().message;
        failed.exitCode = -1;
        return failed;
    }
    return res.value();
}

fs::path initGitRepo(const fs::path& repoPath) {
    fs::create_directories(repoPath);
    git(repoPath, {"init", "-q"});
    git(repoPath, {"symbolic-ref", "HEAD", "refs/heads/main"});
    git(repoPath, {"config", "user.name", "Test User"});
    git(repoPath, {"config", "user.email", "test@example.com"});
    git(repoPath, {"config", "commit.gpgsign", "false"});
    git(repoPath, {"config", "core.autocrlf", "false"});
    return fs::canonical(repoPath);
}

void commitAll(const fs::path& repoPath, const std::string& message) {
    git(repoPath, {"add", "-A"});
    git(repoPath, {"commit", "-q", "-m", message});
}

} // namespace linetrack::test::utils
