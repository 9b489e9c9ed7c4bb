#include "CpuScheduler.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <string>
#include <utility>

namespace ossim {

Status CpuScheduler::admit(ProcessInfo process) {
    if (process.state != ProcessState::NEW && process.state != ProcessState::READY) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "process " + std::to_string(process.process_id) + " is " +
                                   toString(process.state) + ", expected NEW or READY");
    }
    if (process.burst_time < 0 || process.arrival_time < 0) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "process " + std::to_string(process.process_id) +
                                   " has a negative burst or arrival time");
    }
    if (process.state == ProcessState::NEW) {
        process.remaining_time = process.burst_time;
    } else if (process.remaining_time < 0 || process.remaining_time > process.burst_time) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "process " + std::to_string(process.process_id) +
                                   " has remaining time outside [0, burst]");
    }
    // every policy advances the clock by at most the sum of pending bursts
    long long pending = static_cast<long long>(clock_) + process.burst_time;
    for (const auto& queued : ready_) {
        pending += queued.burst_time;
    }
    if (pending > std::numeric_limits<int>::max()) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "process " + std::to_string(process.process_id) +
                                   " would overflow the scheduler clock");
    }
    process.state = ProcessState::READY;
    emit(TraceEventType::PROCESS_ADMITTED, process.process_id);
    ready_.push_back(std::move(process));
    return Status::success();
}

std::vector<DispatchSlice> CpuScheduler::runFcfs() {
    std::vector<ProcessInfo> order = drainReady();
    std::stable_sort(order.begin(), order.end(),
                     [](const ProcessInfo& a, const ProcessInfo& b) {
                         return a.arrival_time < b.arrival_time;
                     });
    return runToCompletion(std::move(order));
}

std::vector<DispatchSlice> CpuScheduler::runSjf() {
    std::vector<ProcessInfo> order = drainReady();
    std::stable_sort(order.begin(), order.end(),
                     [](const ProcessInfo& a, const ProcessInfo& b) {
                         return a.burst_time < b.burst_time;
                     });
    return runToCompletion(std::move(order));
}

Result<std::vector<DispatchSlice>> CpuScheduler::runRoundRobin(int quantum) {
    if (quantum <= 0) {
        return Result<std::vector<DispatchSlice>>::failure(
            ErrorCode::INVALID_ARGUMENT, "quantum must be positive, got " + std::to_string(quantum));
    }

    std::vector<DispatchSlice> slices;
    std::deque<ProcessInfo> queue(std::make_move_iterator(ready_.begin()),
                                  std::make_move_iterator(ready_.end()));
    ready_.clear();

    while (!queue.empty()) {
        ProcessInfo process = std::move(queue.front());
        queue.pop_front();

        process.state = ProcessState::RUNNING;
        int slice = std::min(quantum, process.remaining_time);
        emit(TraceEventType::PROCESS_DISPATCHED, process.process_id, slice);
        slices.push_back({process.process_id, clock_, slice});

        clock_ += slice;
        process.remaining_time -= slice;

        if (process.remaining_time > 0) {
            process.state = ProcessState::READY;
            emit(TraceEventType::PROCESS_PREEMPTED, process.process_id, process.remaining_time);
            queue.push_back(std::move(process));
        } else {
            process.turnaround_time = clock_ - process.arrival_time;
            process.waiting_time = process.turnaround_time - process.burst_time;
            terminate(process);
        }
    }
    return Result<std::vector<DispatchSlice>>::success(std::move(slices));
}

Result<std::vector<DispatchSlice>> CpuScheduler::run(SchedulingPolicy policy, int quantum) {
    switch (policy) {
    case SchedulingPolicy::FCFS:
        return Result<std::vector<DispatchSlice>>::success(runFcfs());
    case SchedulingPolicy::SJF:
        return Result<std::vector<DispatchSlice>>::success(runSjf());
    case SchedulingPolicy::ROUND_ROBIN:
        return runRoundRobin(quantum);
    }
    return Result<std::vector<DispatchSlice>>::failure(ErrorCode::INVALID_ARGUMENT,
                                                       "unknown scheduling policy");
}

Result<SchedulingStatistics> CpuScheduler::statistics() const {
    if (completed_.empty()) {
        return Result<SchedulingStatistics>::failure(ErrorCode::EMPTY_RESULT,
                                                     "no process has completed");
    }
    SchedulingStatistics stats;
    long long totalWaiting = 0;
    long long totalTurnaround = 0;
    for (const auto& p : completed_) {
        stats.processes.push_back({p.process_id, p.name, p.burst_time, p.waiting_time, p.turnaround_time});
        totalWaiting += p.waiting_time;
        totalTurnaround += p.turnaround_time;
    }
    double count = static_cast<double>(completed_.size());
    stats.average_waiting = static_cast<double>(totalWaiting) / count;
    stats.average_turnaround = static_cast<double>(totalTurnaround) / count;
    return Result<SchedulingStatistics>::success(std::move(stats));
}

std::vector<DispatchSlice> CpuScheduler::runToCompletion(std::vector<ProcessInfo> order) {
    std::vector<DispatchSlice> slices;
    slices.reserve(order.size());
    for (auto& process : order) {
        process.state = ProcessState::RUNNING;
        emit(TraceEventType::PROCESS_DISPATCHED, process.process_id, process.burst_time);
        slices.push_back({process.process_id, clock_, process.burst_time});

        process.waiting_time = clock_ - process.arrival_time;
        clock_ += process.burst_time;
        process.turnaround_time = clock_ - process.arrival_time;
        process.remaining_time = 0;
        terminate(process);
    }
    return slices;
}

std::vector<ProcessInfo> CpuScheduler::drainReady() {
    std::vector<ProcessInfo> order(std::make_move_iterator(ready_.begin()),
                                   std::make_move_iterator(ready_.end()));
    ready_.clear();
    return order;
}

void CpuScheduler::terminate(ProcessInfo& process) {
    process.state = ProcessState::TERMINATED;
    emit(TraceEventType::PROCESS_TERMINATED, process.process_id, process.waiting_time,
         process.turnaround_time);
    completed_.push_back(std::move(process));
}

void CpuScheduler::emit(TraceEventType type, int pid, std::int64_t first, std::int64_t second) const {
    if (trace_) {
        trace_(TraceEvent{type, clock_, pid, first, second});
    }
}

} // namespace ossim
