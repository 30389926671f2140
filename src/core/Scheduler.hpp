#pragma once

#include <future>
#include <mutex>
#include <type_traits>
#include <utility>

namespace linetrack {

/**
 * @brief Cooperative task scheduler
 *
 * Each spawned task runs on its own thread but must hold the scheduler's run
 * token to execute, so only one task is active at a time. A task gives up the
 * token only inside suspend(), which ProcessRunner uses while waiting for a
 * child process. State mutation after a process call therefore happens with
 * the token held, in the resumed task.
 *
 * Code running outside any task is unaffected: suspend() just runs the wait.
 * There is no cancellation; a process that never exits stalls its task.
 */
class Scheduler {
public:
    Scheduler() = default;
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Start a logical task; the future yields fn()'s result
    template <typename F>
    auto spawn(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        return std::async(std::launch::async, [this, task = std::forward<F>(fn)]() mutable {
            TaskScope scope(*this);
            return task();
        });
    }

    /// Run `wait` with the calling task's run token released
    template <typename F>
    static auto suspend(F&& wait) -> decltype(wait()) {
        SuspendScope scope;
        return wait();
    }

    /// True when called from inside a spawned task
    static bool inTask();

private:
    class TaskScope {
    public:
        explicit TaskScope(Scheduler& scheduler);
        ~TaskScope();

    private:
        std::unique_lock<std::mutex> lock;
    };

    class SuspendScope {
    public:
        SuspendScope();
        ~SuspendScope();

    private:
        std::unique_lock<std::mutex>* held;
    };

    std::mutex runToken;
};

}
