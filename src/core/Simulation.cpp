#include "Simulation.hpp"

#include <utility>

namespace ossim {

Status Simulation::initialize(const SimulationConfig& config) {
    Status status = config.validate();
    if (!status.ok()) {
        return status;
    }
    config_ = config;
    memory_ = std::make_unique<MemoryAllocator>(config_.totalMemory);
    pageTable_ = std::make_unique<PageTable>(config_.pageSize);
    disk_ = std::make_unique<DiskScheduler>(config_.diskCylinders);
    initialized_ = true;
    setTraceSink(trace_);
    return Status::success();
}

void Simulation::setTraceSink(TraceSink sink) {
    trace_ = std::move(sink);
    if (memory_) {
        memory_->setTraceSink(trace_);
    }
    if (pageTable_) {
        pageTable_->setTraceSink(trace_);
    }
    if (disk_) {
        disk_->setTraceSink(trace_);
    }
}

Result<ScheduleReport> Simulation::scheduleCpu(const std::vector<ProcessInfo>& workload) const {
    Status status = requireInitialized();
    if (!status.ok()) {
        return Result<ScheduleReport>::failure(status);
    }

    CpuScheduler scheduler;
    scheduler.setTraceSink(trace_);
    for (const auto& process : workload) {
        status = scheduler.admit(process);
        if (!status.ok()) {
            return Result<ScheduleReport>::failure(status);
        }
    }

    auto slices = scheduler.run(config_.scheduler, config_.quantum);
    if (!slices.ok()) {
        return Result<ScheduleReport>::failure(slices.status());
    }
    auto stats = scheduler.statistics();
    if (!stats.ok()) {
        return Result<ScheduleReport>::failure(stats.status());
    }

    ScheduleReport report;
    report.policy = config_.scheduler;
    report.slices = std::move(*slices.value);
    report.statistics = std::move(*stats.value);
    report.finish_time = scheduler.clock();
    return Result<ScheduleReport>::success(std::move(report));
}

Result<SafetyReport> Simulation::checkSafety(const ResourceSnapshot& snapshot) const {
    return DeadlockDetector::evaluate(snapshot, trace_);
}

Result<SeekSchedule> Simulation::scheduleDisk(const std::vector<int>& requests, bool useScan) const {
    Status status = requireInitialized();
    if (!status.ok()) {
        return Result<SeekSchedule>::failure(status);
    }
    if (useScan) {
        return disk_->scan(requests, config_.diskHead, config_.diskDirection);
    }
    return disk_->fcfs(requests, config_.diskHead);
}

Status Simulation::requireInitialized() const {
    if (!initialized_) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "simulation not initialized");
    }
    return Status::success();
}

} // namespace ossim
