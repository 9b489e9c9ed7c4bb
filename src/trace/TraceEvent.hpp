#pragma once

#include <cstdint>
#include <functional>

namespace ossim {

// Kind of step an engine reports to an attached observer.
enum class TraceEventType {
    PROCESS_ADMITTED,
    PROCESS_DISPATCHED,  // payload: run length
    PROCESS_PREEMPTED,   // payload: remaining time
    PROCESS_TERMINATED,  // payload: waiting, turnaround
    EXTENT_ALLOCATED,    // payload: address, size
    EXTENT_SPLIT,        // payload: address of remainder, remainder size
    ALLOCATION_FAILED,   // payload: requested size
    EXTENT_FREED,        // payload: address, size
    EXTENTS_MERGED,      // payload: address, merged size
    PROCESS_FINISHED,    // Banker's: process declared safe to finish
    DEADLOCK_DETECTED,   // payload: number of deadlocked processes
    HEAD_MOVED,          // subject: target track; payload: from, seek
    PAGE_TRANSLATED,     // subject: page; payload: logical, physical
    PAGE_FAULT,          // subject: page; payload: logical
    SEMAPHORE_ACQUIRED,
    SEMAPHORE_BLOCKED,
    SEMAPHORE_RELEASED,
    SEMAPHORE_WOKEN
};

/**
 * A single observable step. Engines without a clock report time 0.
 */
struct TraceEvent {
    TraceEventType type;
    std::int64_t time{0};
    int subject{0};          // pid, track or page depending on type
    std::int64_t first{0};
    std::int64_t second{0};
};

// Optional observer attached to an engine. An empty sink disables tracing.
using TraceSink = std::function<void(const TraceEvent&)>;

} // namespace ossim
