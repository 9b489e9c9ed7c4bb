#include <limits>
#include <vector>

#include "TestSupport.hpp"
#include "scheduler/CpuScheduler.hpp"

using namespace ossim;
using ossim_test::check;
using ossim_test::checkEqual;
using ossim_test::checkNear;

namespace {

std::vector<ProcessInfo> textbookWorkload() {
    return {
        {1, "P1", 1, 5, 0},
        {2, "P2", 2, 3, 1},
        {3, "P3", 1, 8, 2},
    };
}

void admitAll(CpuScheduler& scheduler, const std::vector<ProcessInfo>& workload) {
    for (const auto& p : workload) {
        check(scheduler.admit(p).ok(), __LINE__);
    }
}

void expectConservation(const CpuScheduler& scheduler) {
    for (const auto& p : scheduler.completed()) {
        checkEqual(p.waiting_time + p.burst_time, p.turnaround_time, __LINE__);
        checkEqual(p.remaining_time, 0, __LINE__);
        check(p.state == ProcessState::TERMINATED, __LINE__);
    }
}

void testFcfsTimings() {
    CpuScheduler scheduler;
    admitAll(scheduler, textbookWorkload());
    auto slices = scheduler.runFcfs();

    if (!check(slices.size() == 3, __LINE__)) {
        return;
    }
    checkEqual(slices[0].process_id, 1, __LINE__);
    checkEqual(slices[1].start, 5, __LINE__);
    checkEqual(slices[2].start, 8, __LINE__);
    checkEqual(scheduler.clock(), 16, __LINE__);
    check(scheduler.readyQueue().empty(), __LINE__);

    const auto& done = scheduler.completed();
    if (!check(done.size() == 3, __LINE__)) {
        return;
    }
    checkEqual(done[0].waiting_time, 0, __LINE__);
    checkEqual(done[1].waiting_time, 4, __LINE__);
    checkEqual(done[2].waiting_time, 6, __LINE__);
    checkEqual(done[2].turnaround_time, 14, __LINE__);
    expectConservation(scheduler);

    auto stats = scheduler.statistics();
    if (!check(stats.ok(), __LINE__)) {
        return;
    }
    checkNear(stats.value->average_waiting, 10.0 / 3.0, 1e-9, __LINE__);
    checkNear(stats.value->average_turnaround, 26.0 / 3.0, 1e-9, __LINE__);
}

void testFcfsKeepsAdmissionOrderOnTies() {
    CpuScheduler scheduler;
    admitAll(scheduler, {{3, "C", 0, 2, 0}, {1, "A", 0, 4, 0}, {2, "B", 0, 1, 0}});
    scheduler.runFcfs();
    const auto& done = scheduler.completed();
    if (!check(done.size() == 3, __LINE__)) {
        return;
    }
    checkEqual(done[0].process_id, 3, __LINE__);
    checkEqual(done[1].process_id, 1, __LINE__);
    checkEqual(done[2].process_id, 2, __LINE__);
}

void testLateArrivalGetsNegativeWaiting() {
    // the clock never jumps ahead to an arrival
    std::vector<ProcessInfo> gap = {{1, "P1", 0, 3, 0}, {2, "P2", 0, 2, 10}};

    CpuScheduler fcfs;
    admitAll(fcfs, gap);
    auto slices = fcfs.runFcfs();
    if (!check(slices.size() == 2, __LINE__)) {
        return;
    }
    checkEqual(slices[1].start, 3, __LINE__);
    checkEqual(fcfs.completed()[1].waiting_time, -7, __LINE__);
    checkEqual(fcfs.completed()[1].turnaround_time, -5, __LINE__);
    checkEqual(fcfs.clock(), 5, __LINE__);
    expectConservation(fcfs);

    CpuScheduler rr;
    admitAll(rr, gap);
    if (!check(rr.runRoundRobin(4).ok(), __LINE__)) {
        return;
    }
    checkEqual(rr.completed()[1].waiting_time, -7, __LINE__);
    checkEqual(rr.completed()[1].turnaround_time, -5, __LINE__);
    checkEqual(rr.clock(), 5, __LINE__);
}

void testSjfOrdersByBurstAndIgnoresArrival() {
    CpuScheduler scheduler;
    admitAll(scheduler, textbookWorkload());
    scheduler.runSjf();

    const auto& done = scheduler.completed();
    if (!check(done.size() == 3, __LINE__)) {
        return;
    }
    checkEqual(done[0].process_id, 2, __LINE__);
    checkEqual(done[1].process_id, 1, __LINE__);
    checkEqual(done[2].process_id, 3, __LINE__);
    // P2 runs at time 0 although it arrives at 1
    checkEqual(done[0].waiting_time, -1, __LINE__);
    checkEqual(done[0].turnaround_time, 2, __LINE__);
    checkEqual(done[1].waiting_time, 3, __LINE__);
    expectConservation(scheduler);
}

void testRoundRobinPreempts() {
    CpuScheduler scheduler;
    admitAll(scheduler, textbookWorkload());
    auto slices = scheduler.runRoundRobin(2);
    if (!check(slices.ok(), __LINE__)) {
        return;
    }
    checkEqual(slices.value->size(), 9u, __LINE__);
    checkEqual(scheduler.clock(), 16, __LINE__);
    check(scheduler.readyQueue().empty(), __LINE__);

    const auto& done = scheduler.completed();
    if (!check(done.size() == 3, __LINE__)) {
        return;
    }
    checkEqual(done[0].process_id, 2, __LINE__);
    checkEqual(done[0].turnaround_time, 8, __LINE__);
    checkEqual(done[0].waiting_time, 5, __LINE__);
    checkEqual(done[1].process_id, 1, __LINE__);
    checkEqual(done[1].turnaround_time, 12, __LINE__);
    checkEqual(done[2].process_id, 3, __LINE__);
    checkEqual(done[2].turnaround_time, 14, __LINE__);
    expectConservation(scheduler);
}

void testRoundRobinWithLargeQuantumMatchesFcfs() {
    CpuScheduler fcfs;
    CpuScheduler rr;
    admitAll(fcfs, textbookWorkload());
    admitAll(rr, textbookWorkload());
    fcfs.runFcfs();
    if (!check(rr.runRoundRobin(8).ok(), __LINE__)) {
        return;
    }

    if (!check(fcfs.completed().size() == rr.completed().size(), __LINE__)) {
        return;
    }
    for (std::size_t i = 0; i < fcfs.completed().size(); ++i) {
        checkEqual(fcfs.completed()[i].process_id, rr.completed()[i].process_id, __LINE__);
        checkEqual(fcfs.completed()[i].waiting_time, rr.completed()[i].waiting_time, __LINE__);
        checkEqual(fcfs.completed()[i].turnaround_time, rr.completed()[i].turnaround_time, __LINE__);
    }
    checkEqual(fcfs.clock(), rr.clock(), __LINE__);
}

void testRejectsBadInput() {
    CpuScheduler scheduler;
    check(scheduler.runRoundRobin(0).error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(scheduler.runRoundRobin(-3).error == ErrorCode::INVALID_ARGUMENT, __LINE__);

    ProcessInfo finished{1, "done", 0, 4, 0};
    finished.state = ProcessState::TERMINATED;
    check(scheduler.admit(finished).error == ErrorCode::INVALID_ARGUMENT, __LINE__);

    ProcessInfo negative{2, "neg", 0, -1, 0};
    check(scheduler.admit(negative).error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(scheduler.readyQueue().empty(), __LINE__);
}

void testReadyProcessKeepsRemainingTime() {
    ProcessInfo resumed{2, "B", 0, 6, 0};
    resumed.state = ProcessState::READY;
    resumed.remaining_time = 2;

    CpuScheduler scheduler;
    check(scheduler.admit({1, "A", 0, 4, 0}).ok(), __LINE__);
    check(scheduler.admit(resumed).ok(), __LINE__);
    auto slices = scheduler.runRoundRobin(2);
    if (!check(slices.ok(), __LINE__)) {
        return;
    }
    checkEqual(slices.value->size(), 3u, __LINE__);

    const auto& done = scheduler.completed();
    if (!check(done.size() == 2, __LINE__)) {
        return;
    }
    checkEqual(done[0].process_id, 2, __LINE__);
    checkEqual(done[0].turnaround_time, 4, __LINE__);
    checkEqual(done[0].waiting_time, done[0].turnaround_time - done[0].burst_time, __LINE__);
    checkEqual(done[0].waiting_time, -2, __LINE__);
    checkEqual(done[1].process_id, 1, __LINE__);
    checkEqual(done[1].turnaround_time, 6, __LINE__);
    checkEqual(done[1].waiting_time, 2, __LINE__);
}

void testReadyProcessOutsideBurstIsRejected() {
    CpuScheduler scheduler;
    ProcessInfo tooMuch{1, "over", 0, 6, 0};
    tooMuch.state = ProcessState::READY;
    tooMuch.remaining_time = 7;
    check(scheduler.admit(tooMuch).error == ErrorCode::INVALID_ARGUMENT, __LINE__);

    ProcessInfo negative{2, "under", 0, 6, 0};
    negative.state = ProcessState::READY;
    negative.remaining_time = -1;
    check(scheduler.admit(negative).error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    check(scheduler.readyQueue().empty(), __LINE__);
}

void testClockOverflowIsRejected() {
    CpuScheduler scheduler;
    check(scheduler.admit({1, "huge", 0, std::numeric_limits<int>::max(), 0}).ok(), __LINE__);
    check(scheduler.admit({2, "one", 0, 1, 0}).error == ErrorCode::INVALID_ARGUMENT, __LINE__);
    checkEqual(scheduler.readyQueue().size(), 1u, __LINE__);
}

void testStatisticsRequireCompletedWork() {
    CpuScheduler scheduler;
    auto stats = scheduler.statistics();
    check(!stats.ok(), __LINE__);
    check(stats.error == ErrorCode::EMPTY_RESULT, __LINE__);
    check(!stats.value.has_value(), __LINE__);
}

void testRunDispatchesPolicy() {
    CpuScheduler scheduler;
    admitAll(scheduler, textbookWorkload());
    auto slices = scheduler.run(SchedulingPolicy::ROUND_ROBIN, 4);
    if (!check(slices.ok(), __LINE__)) {
        return;
    }
    checkEqual(scheduler.completed().size(), 3u, __LINE__);

    auto parsed = parseSchedulingPolicy("round-robin");
    check(parsed.ok() && *parsed.value == SchedulingPolicy::ROUND_ROBIN, __LINE__);
    check(parseSchedulingPolicy("lottery").error == ErrorCode::INVALID_ARGUMENT, __LINE__);
}

} // namespace

int main() {
    testFcfsTimings();
    testFcfsKeepsAdmissionOrderOnTies();
    testLateArrivalGetsNegativeWaiting();
    testSjfOrdersByBurstAndIgnoresArrival();
    testRoundRobinPreempts();
    testRoundRobinWithLargeQuantumMatchesFcfs();
    testRejectsBadInput();
    testReadyProcessKeepsRemainingTime();
    testReadyProcessOutsideBurstIsRejected();
    testClockOverflowIsRejected();
    testStatisticsRequireCompletedWork();
    testRunDispatchesPolicy();
    return ossim_test::finish("test_cpu_scheduler");
}
