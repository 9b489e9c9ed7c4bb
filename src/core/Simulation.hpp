#pragma once

#include <memory>
#include <vector>

#include "config/SimulationConfig.hpp"
#include "core/Result.hpp"
#include "deadlock/DeadlockDetector.hpp"
#include "disk/DiskScheduler.hpp"
#include "memory/MemoryAllocator.hpp"
#include "paging/PageTable.hpp"
#include "process/ProcessInfo.hpp"
#include "scheduler/CpuScheduler.hpp"
#include "trace/TraceEvent.hpp"

namespace ossim {

struct ScheduleReport {
    SchedulingPolicy policy{SchedulingPolicy::FCFS};
    std::vector<DispatchSlice> slices;
    SchedulingStatistics statistics;
    int finish_time{0};
};

/**
 * Simulation wires the engines to one configuration and trace sink. Each
 * engine is still invoked independently; nothing flows between them.
 */
class Simulation {
public:
    Simulation() = default;

    /** Validate the configuration and build the stateful engines. */
    Status initialize(const SimulationConfig& config);

    bool initialized() const { return initialized_; }
    const SimulationConfig& config() const { return config_; }

    /** Attach a sink to every engine, including ones already built. */
    void setTraceSink(TraceSink sink);

    /**
     * Admit the workload into a fresh scheduler and run the configured
     * policy to completion.
     */
    Result<ScheduleReport> scheduleCpu(const std::vector<ProcessInfo>& workload) const;

    /** Allocator sized from total-memory; nullptr before initialize(). */
    MemoryAllocator* memory() { return memory_.get(); }

    /** Page table sized from page-size; nullptr before initialize(). */
    PageTable* pageTable() { return pageTable_.get(); }

    Result<SafetyReport> checkSafety(const ResourceSnapshot& snapshot) const;

    /** FCFS, or SCAN in the configured direction when useScan is set. */
    Result<SeekSchedule> scheduleDisk(const std::vector<int>& requests, bool useScan) const;

private:
    Status requireInitialized() const;

    SimulationConfig config_;
    std::unique_ptr<MemoryAllocator> memory_;
    std::unique_ptr<PageTable> pageTable_;
    std::unique_ptr<DiskScheduler> disk_;
    TraceSink trace_;
    bool initialized_{false};
};

} // namespace ossim
