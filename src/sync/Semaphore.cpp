#include "Semaphore.hpp"

#include <stdexcept>
#include <string>

namespace ossim {

Semaphore::Semaphore(int initialValue) : value_(initialValue) {
    if (value_ < 0) {
        throw std::invalid_argument("semaphore initial value must be non-negative, got " +
                                    std::to_string(initialValue));
    }
}

WaitOutcome Semaphore::wait(int pid) {
    --value_;
    if (value_ < 0) {
        waiters_.push_back(pid);
        emit(TraceEventType::SEMAPHORE_BLOCKED, pid);
        return WaitOutcome::BLOCKED;
    }
    emit(TraceEventType::SEMAPHORE_ACQUIRED, pid);
    return WaitOutcome::ACQUIRED;
}

std::optional<int> Semaphore::signal() {
    ++value_;
    emit(TraceEventType::SEMAPHORE_RELEASED, 0);
    if (waiters_.empty()) {
        return std::nullopt;
    }
    int woken = waiters_.front();
    waiters_.pop_front();
    emit(TraceEventType::SEMAPHORE_WOKEN, woken);
    return woken;
}

void Semaphore::emit(TraceEventType type, int pid) const {
    if (trace_) {
        trace_(TraceEvent{type, 0, pid, value_, 0});
    }
}

} // namespace ossim
