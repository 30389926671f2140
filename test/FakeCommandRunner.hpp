#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "core/CommandRunner.hpp"

namespace linetrack::test {

/**
 * @brief Scripted ICommandRunner
 *
 * Responses are keyed by a verb that must appear among the job's arguments
 * ("rev-parse", "ls-files", ...). Each verb holds a queue; the last queued
 * response repeats once the others are used up. Jobs that match nothing
 * succeed with empty output. Every job is recorded in `calls`.
 */
class FakeCommandRunner : public ICommandRunner {
public:
    void respond(const std::string& verb, std::vector<std::string> lines, int exitCode = 0,
                 std::string err = "") {
        ProcessOutput out;
        for (const auto& l : lines) {
            out.out += l;
            out.out += '\n';
        }
        out.err = std::move(err);
        out.exitCode = exitCode;
        scripted[verb].push_back(std::move(out));
    }

    /// Jobs whose arguments contain `verb`
    std::vector<JobSpec> callsWith(const std::string& verb) const {
        std::vector<JobSpec> out;
        for (const auto& c : calls) {
            if (hasArg(c, verb)) out.push_back(c);
        }
        return out;
    }

    std::vector<JobSpec> calls;

protected:
    Expected<ProcessOutput> execute(const JobSpec& spec) override {
        calls.push_back(spec);
        for (auto& [verb, queue] : scripted) {
            if (queue.empty() || !hasArg(spec, verb)) continue;
            ProcessOutput out = queue.front();
            if (queue.size() > 1) queue.pop_front();
            return out;
        }
        return ProcessOutput{};
    }

private:
    static bool hasArg(const JobSpec& spec, const std::string& verb) {
        for (const auto& a : spec.args) {
            if (a == verb) return true;
        }
        return false;
    }

    std::map<std::string, std::deque<ProcessOutput>> scripted;
};

} // namespace linetrack::test
