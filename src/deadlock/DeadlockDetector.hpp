#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "core/ResourceVector.hpp"
#include "core/Result.hpp"
#include "trace/TraceEvent.hpp"

namespace ossim {

// Caller-supplied resource state for one detection run.
struct ResourceSnapshot {
    std::vector<ResourceVector> allocation; // held, one row per process
    std::vector<ResourceVector> max_need;   // maximum claim, one row per process
    ResourceVector available;               // unallocated pool
};

enum class SafetyVerdict {
    SAFE,
    UNSAFE
};

const char* toString(SafetyVerdict verdict);

struct SafetyReport {
    SafetyVerdict verdict{SafetyVerdict::SAFE};
    std::vector<int> safe_sequence;          // processes in the order they finished
    std::vector<ResourceVector> work_before; // work vector seen by each finished process
    std::vector<int> deadlocked;             // unfinished processes when UNSAFE
};

/**
 * Banker's safety algorithm used as a detector. Among processes that can
 * finish, the lowest index always goes first, so identical matrices give
 * identical sequences.
 */
class DeadlockDetector {
public:
    DeadlockDetector(std::size_t numProcesses, std::size_t numResources);

    void setTraceSink(TraceSink sink) { trace_ = std::move(sink); }

    Status setAllocation(std::size_t process, ResourceVector resources);
    Status setMaxNeed(std::size_t process, ResourceVector resources);
    Status setAvailable(ResourceVector resources);

    /** Run the safety check over the matrices set so far. */
    Result<SafetyReport> detect() const;

    /**
     * Validate and evaluate a complete snapshot. Fails with
     * INVALID_ARGUMENT on ragged rows or negative quantities.
     */
    static Result<SafetyReport> evaluate(const ResourceSnapshot& snapshot,
                                         const TraceSink& trace = TraceSink());

    std::size_t processCount() const { return snapshot_.allocation.size(); }
    std::size_t resourceCount() const { return snapshot_.available.width(); }

private:
    Status checkRow(std::size_t process, const ResourceVector& resources) const;

    ResourceSnapshot snapshot_;
    TraceSink trace_;
};

} // namespace ossim
