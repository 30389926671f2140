#include "core/CommandRunner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/Scheduler.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace linetrack {

namespace {

/// Closes the descriptor on scope exit
class FileDescriptor {
public:
    FileDescriptor() = default;
    ~FileDescriptor() { reset(); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd; }
    bool open() const { return fd >= 0; }
    void assign(int newFd) {
        reset();
        fd = newFd;
    }
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }

private:
    int fd{-1};
};

bool makePipe(FileDescriptor& readEnd, FileDescriptor& writeEnd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    readEnd.assign(fds[0]);
    writeEnd.assign(fds[1]);
    return true;
}

std::string describe(const JobSpec& spec) {
    std::ostringstream os;
    os << spec.command;
    for (const auto& a : spec.args) os << ' ' << a;
    return os.str();
}

/// Drain whatever is readable; closes the descriptor at EOF
void readAvailable(FileDescriptor& fd, std::string& sink) {
    char buf[4096];
    ssize_t n = ::read(fd.get(), buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        fd.reset();
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::once_flag ignoreSigpipeOnce;

}

std::vector<std::string> splitOutputLines(const std::string& out) {
    auto lines = StringUtils::split(out, '\n');
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

Expected<CommandResult> ICommandRunner::run(const JobSpec& spec) {
    Logger::instance().debug("Running: " + describe(spec) + " (cwd " + spec.cwd.string() + ")");

    auto raw = execute(spec);
    if (!raw) return raw.error();

    CommandResult result;
    result.lines = splitOutputLines(raw.value().out);
    result.stderrText = std::move(raw.value().err);
    result.exitCode = raw.value().exitCode;

    if (!spec.suppressStderr && !result.stderrText.empty()) {
        Logger::instance().warn(spec.command + ": " + StringUtils::trim(result.stderrText));
    }
    Logger::instance().debug(std::to_string(result.lines.size()) + " lines from " + spec.command);
    return result;
}

std::future<Expected<CommandResult>> ICommandRunner::runAsync(JobSpec spec) {
    return std::async(std::launch::async, [this, job = std::move(spec)] { return run(job); });
}

ProcessRunner::ProcessRunner() {
    // A child that exits before reading its input must not kill us on write
    std::call_once(ignoreSigpipeOnce, [] { std::signal(SIGPIPE, SIG_IGN); });
}

Expected<ProcessOutput> ProcessRunner::execute(const JobSpec& spec) {
    // Everything the child touches is prepared before fork()
    std::vector<std::string> argvStorage;
    argvStorage.reserve(spec.args.size() + 1);
    argvStorage.push_back(spec.command);
    argvStorage.insert(argvStorage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStorage) argv.push_back(a.data());
    argv.push_back(nullptr);
    const std::string cwd = spec.cwd.string();

    FileDescriptor inRead, inWrite, outRead, outWrite, errRead, errWrite, execRead, execWrite;
    if (!makePipe(inRead, inWrite) || !makePipe(outRead, outWrite) || !makePipe(errRead, errWrite) ||
        !makePipe(execRead, execWrite)) {
        return Error{ErrorCode::SpawnFailed, std::string("pipe() failed: ") + std::strerror(errno)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::SpawnFailed, std::string("fork() failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(inRead.get(), STDIN_FILENO);
        ::dup2(outWrite.get(), STDOUT_FILENO);
        ::dup2(errWrite.get(), STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            int e = errno;
            ssize_t ignored = ::write(execWrite.get(), &e, sizeof(e));
            (void)ignored;
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        int e = errno;
        ssize_t ignored = ::write(execWrite.get(), &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    inRead.reset();
    outWrite.reset();
    errWrite.reset();
    execWrite.reset();

    std::string input;
    if (spec.inputLines) {
        for (const auto& line : *spec.inputLines) {
            input += line;
            input += '\n';
        }
    }
    if (input.empty()) {
        inWrite.reset();
    } else {
        ::fcntl(inWrite.get(), F_SETFL, O_NONBLOCK);
    }

    ProcessOutput output;
    int execErrno = 0;
    int status = 0;

    Scheduler::suspend([&] {
        // execRead reaches EOF once exec succeeds (O_CLOEXEC), or carries errno
        ssize_t n;
        do {
            n = ::read(execRead.get(), &execErrno, sizeof(execErrno));
        } while (n < 0 && errno == EINTR);
        if (n != static_cast<ssize_t>(sizeof(execErrno))) execErrno = 0;

        size_t written = 0;
        while (outRead.open() || errRead.open()) {
            pollfd fds[3];
            nfds_t count = 0;
            int outIdx = -1, errIdx = -1, inIdx = -1;
            if (outRead.open()) { outIdx = static_cast<int>(count); fds[count++] = {outRead.get(), POLLIN, 0}; }
            if (errRead.open()) { errIdx = static_cast<int>(count); fds[count++] = {errRead.get(), POLLIN, 0}; }
            if (inWrite.open()) { inIdx = static_cast<int>(count); fds[count++] = {inWrite.get(), POLLOUT, 0}; }

            if (::poll(fds, count, -1) < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (outIdx >= 0 && fds[outIdx].revents) readAvailable(outRead, output.out);
            if (errIdx >= 0 && fds[errIdx].revents) readAvailable(errRead, output.err);
            if (inIdx >= 0 && fds[inIdx].revents) {
                if (fds[inIdx].revents & (POLLERR | POLLHUP)) {
                    inWrite.reset();
                    continue;
                }
                ssize_t w = ::write(inWrite.get(), input.data() + written, input.size() - written);
                if (w > 0) {
                    written += static_cast<size_t>(w);
                    if (written == input.size()) inWrite.reset();
                } else if (errno != EINTR && errno != EAGAIN) {
                    inWrite.reset();
                }
            }
        }
        inWrite.reset();

        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    });

    if (execErrno != 0) {
        return Error{ErrorCode::SpawnFailed, "Failed to run " + spec.command + ": " + std::strerror(execErrno)};
    }
    output.exitCode = decodeStatus(status);
    return output;
}

}
