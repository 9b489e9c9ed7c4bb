#pragma once

namespace ossim {

/**
 * Enumeration of possible states a simulated process can be in.
 */
enum class ProcessState {
    NEW,       ///< Process has been created but not yet admitted.
    READY,     ///< Process is waiting in the ready collection.
    RUNNING,   ///< Process is currently dispatched.
    WAITING,   ///< Blocked on I/O. Not reached by the CPU scheduler.
    TERMINATED ///< Process has used its whole burst.
};

inline const char* toString(ProcessState state) {
    switch (state) {
    case ProcessState::NEW: return "NEW";
    case ProcessState::READY: return "READY";
    case ProcessState::RUNNING: return "RUNNING";
    case ProcessState::WAITING: return "WAITING";
    case ProcessState::TERMINATED: return "TERMINATED";
    }
    return "UNKNOWN";
}

} // namespace ossim
