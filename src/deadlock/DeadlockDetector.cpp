#include "DeadlockDetector.hpp"

#include <string>
#include <utility>

namespace ossim {

namespace {

Status validate(const ResourceSnapshot& s) {
    const std::size_t width = s.available.width();
    if (s.allocation.size() != s.max_need.size()) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "allocation has " + std::to_string(s.allocation.size()) +
                                   " rows but max_need has " + std::to_string(s.max_need.size()));
    }
    if (s.available.hasNegative()) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "available has a negative quantity");
    }
    for (std::size_t p = 0; p < s.allocation.size(); ++p) {
        if (s.allocation[p].width() != width || s.max_need[p].width() != width) {
            return Status::failure(ErrorCode::INVALID_ARGUMENT,
                                   "row " + std::to_string(p) + " does not have " +
                                       std::to_string(width) + " resource types");
        }
        if (s.allocation[p].hasNegative() || s.max_need[p].hasNegative()) {
            return Status::failure(ErrorCode::INVALID_ARGUMENT,
                                   "row " + std::to_string(p) + " has a negative quantity");
        }
    }
    return Status::success();
}

} // namespace

const char* toString(SafetyVerdict verdict) {
    return verdict == SafetyVerdict::SAFE ? "SAFE" : "UNSAFE";
}

DeadlockDetector::DeadlockDetector(std::size_t numProcesses, std::size_t numResources) {
    snapshot_.allocation.assign(numProcesses, ResourceVector(numResources));
    snapshot_.max_need.assign(numProcesses, ResourceVector(numResources));
    snapshot_.available = ResourceVector(numResources);
}

Status DeadlockDetector::setAllocation(std::size_t process, ResourceVector resources) {
    Status status = checkRow(process, resources);
    if (status.ok()) {
        snapshot_.allocation[process] = std::move(resources);
    }
    return status;
}

Status DeadlockDetector::setMaxNeed(std::size_t process, ResourceVector resources) {
    Status status = checkRow(process, resources);
    if (status.ok()) {
        snapshot_.max_need[process] = std::move(resources);
    }
    return status;
}

Status DeadlockDetector::setAvailable(ResourceVector resources) {
    if (resources.width() != resourceCount()) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "expected " + std::to_string(resourceCount()) + " resource types");
    }
    if (resources.hasNegative()) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "available has a negative quantity");
    }
    snapshot_.available = std::move(resources);
    return Status::success();
}

Result<SafetyReport> DeadlockDetector::detect() const {
    return evaluate(snapshot_, trace_);
}

Result<SafetyReport> DeadlockDetector::evaluate(const ResourceSnapshot& snapshot,
                                                const TraceSink& trace) {
    Status status = validate(snapshot);
    if (!status.ok()) {
        return Result<SafetyReport>::failure(status);
    }

    const std::size_t n = snapshot.allocation.size();
    std::vector<ResourceVector> need;
    need.reserve(n);
    for (std::size_t p = 0; p < n; ++p) {
        // negative components are allowed and always satisfiable
        need.push_back(snapshot.max_need[p] - snapshot.allocation[p]);
    }

    ResourceVector work = snapshot.available;
    std::vector<bool> finish(n, false);
    SafetyReport report;

    while (report.safe_sequence.size() < n) {
        bool found = false;
        for (std::size_t p = 0; p < n; ++p) {
            if (finish[p] || !need[p].fitsWithin(work)) {
                continue;
            }
            report.work_before.push_back(work);
            work += snapshot.allocation[p];
            finish[p] = true;
            report.safe_sequence.push_back(static_cast<int>(p));
            if (trace) {
                trace(TraceEvent{TraceEventType::PROCESS_FINISHED, 0, static_cast<int>(p), 0, 0});
            }
            found = true;
            break;
        }
        if (!found) {
            break;
        }
    }

    for (std::size_t p = 0; p < n; ++p) {
        if (!finish[p]) {
            report.deadlocked.push_back(static_cast<int>(p));
        }
    }
    if (!report.deadlocked.empty()) {
        report.verdict = SafetyVerdict::UNSAFE;
        if (trace) {
            trace(TraceEvent{TraceEventType::DEADLOCK_DETECTED, 0, 0,
                             static_cast<std::int64_t>(report.deadlocked.size()), 0});
        }
    }
    return Result<SafetyReport>::success(std::move(report));
}

Status DeadlockDetector::checkRow(std::size_t process, const ResourceVector& resources) const {
    if (process >= processCount()) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "process index " + std::to_string(process) + " out of range");
    }
    if (resources.width() != resourceCount()) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "expected " + std::to_string(resourceCount()) + " resource types");
    }
    if (resources.hasNegative()) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "row " + std::to_string(process) + " has a negative quantity");
    }
    return Status::success();
}

} // namespace ossim
