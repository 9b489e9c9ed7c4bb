#pragma once

#include <string>

#include "core/Result.hpp"

namespace ossim {

// Dispatch policy the CPU scheduler applies to its ready collection.
enum class SchedulingPolicy {
    FCFS = 0,        // First come first served, by arrival time
    SJF = 1,         // Shortest job first, non-preemptive
    ROUND_ROBIN = 2  // Time-sliced round robin
};

const char* toString(SchedulingPolicy policy);

// Accepts "fcfs", "sjf", "rr" and "round-robin" (case sensitive).
Result<SchedulingPolicy> parseSchedulingPolicy(const std::string& name);

} // namespace ossim
