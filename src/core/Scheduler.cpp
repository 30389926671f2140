#include "core/Scheduler.hpp"

namespace linetrack {

namespace {

thread_local std::unique_lock<std::mutex>* currentToken = nullptr;

}

Scheduler::TaskScope::TaskScope(Scheduler& scheduler) : lock(scheduler.runToken) {
    currentToken = &lock;
}

Scheduler::TaskScope::~TaskScope() {
    currentToken = nullptr;
}

Scheduler::SuspendScope::SuspendScope() : held(currentToken) {
    if (held && held->owns_lock()) {
        held->unlock();
    } else {
        held = nullptr;
    }
}

Scheduler::SuspendScope::~SuspendScope() {
    if (held) held->lock();
}

bool Scheduler::inTask() {
    return currentToken != nullptr;
}

}
