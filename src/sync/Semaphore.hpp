#pragma once

#include <deque>
#include <optional>
#include <utility>

#include "trace/TraceEvent.hpp"

namespace ossim {

enum class WaitOutcome {
    ACQUIRED,
    BLOCKED
};

/**
 * Simulated counting semaphore. Blocking is bookkeeping only: a blocked
 * caller is recorded on a FIFO wait list and released by signal() in
 * arrival order. No threads are suspended.
 */
class Semaphore {
public:
    /** Throws std::invalid_argument if initialValue is negative. */
    explicit Semaphore(int initialValue = 1);

    void setTraceSink(TraceSink sink) { trace_ = std::move(sink); }

    /** P operation on behalf of pid. */
    WaitOutcome wait(int pid);

    /** V operation. Returns the pid released from the wait list, if any. */
    std::optional<int> signal();

    int value() const { return value_; }
    const std::deque<int>& waiters() const { return waiters_; }

private:
    void emit(TraceEventType type, int pid) const;

    int value_;
    std::deque<int> waiters_;
    TraceSink trace_;
};

} // namespace ossim
