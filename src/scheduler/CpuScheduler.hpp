#pragma once

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "core/Result.hpp"
#include "process/ProcessEnums.hpp"
#include "process/ProcessInfo.hpp"
#include "trace/TraceEvent.hpp"

namespace ossim {

// One contiguous stretch of CPU time given to a process.
struct DispatchSlice {
    int process_id{0};
    int start{0};
    int duration{0};
};

struct ProcessMetrics {
    int process_id{0};
    std::string name;
    int burst_time{0};
    int waiting_time{0};
    int turnaround_time{0};
};

struct SchedulingStatistics {
    std::vector<ProcessMetrics> processes; // in completion order
    double average_waiting{0.0};
    double average_turnaround{0.0};
};

/**
 * Single-CPU scheduler over a pool of process descriptors. Owns a logical
 * clock that only its run methods advance. Every run consumes the whole
 * ready collection and appends to the completed collection, so several
 * workloads can be run back to back on one clock.
 *
 * Not safe for concurrent use; callers serialize access per instance.
 */
class CpuScheduler {
public:
    CpuScheduler() = default;

    void setTraceSink(TraceSink sink) { trace_ = std::move(sink); }

    /**
     * Move a NEW or READY process into the ready collection.
     * NEW processes get remaining_time reset to their burst time.
     * Fails with INVALID_ARGUMENT if the pending bursts would overflow
     * the clock.
     */
    Status admit(ProcessInfo process);

    /**
     * First come first served. Ready processes are stably ordered by
     * arrival time. The clock never jumps forward to an arrival, so a
     * process that arrives after the clock gets a negative waiting time.
     */
    std::vector<DispatchSlice> runFcfs();

    /**
     * Non-preemptive shortest job first, stably ordered by burst time.
     * Arrival times are not consulted: a job may run before it arrives,
     * in which case its waiting time is negative.
     */
    std::vector<DispatchSlice> runSjf();

    /**
     * Preemptive round robin in admission order, without idling for
     * arrivals. Fails with INVALID_ARGUMENT when quantum is not positive.
     */
    Result<std::vector<DispatchSlice>> runRoundRobin(int quantum);

    /** Run the given policy. quantum is only read for ROUND_ROBIN. */
    Result<std::vector<DispatchSlice>> run(SchedulingPolicy policy, int quantum);

    /** Per-process metrics and averages over the completed collection. */
    Result<SchedulingStatistics> statistics() const;

    int clock() const { return clock_; }
    const std::deque<ProcessInfo>& readyQueue() const { return ready_; }
    const std::vector<ProcessInfo>& completed() const { return completed_; }

private:
    std::vector<DispatchSlice> runToCompletion(std::vector<ProcessInfo> order);
    std::vector<ProcessInfo> drainReady();
    void terminate(ProcessInfo& process);
    void emit(TraceEventType type, int pid, std::int64_t first = 0, std::int64_t second = 0) const;

    std::deque<ProcessInfo> ready_;
    std::vector<ProcessInfo> completed_;
    int clock_{0};
    TraceSink trace_;
};

} // namespace ossim
