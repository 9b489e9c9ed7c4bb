#include "ProcessEnums.hpp"

namespace ossim {

const char* toString(SchedulingPolicy policy) {
    switch (policy) {
    case SchedulingPolicy::FCFS: return "fcfs";
    case SchedulingPolicy::SJF: return "sjf";
    case SchedulingPolicy::ROUND_ROBIN: return "rr";
    }
    return "unknown";
}

Result<SchedulingPolicy> parseSchedulingPolicy(const std::string& name) {
    if (name == "fcfs") {
        return Result<SchedulingPolicy>::success(SchedulingPolicy::FCFS);
    }
    if (name == "sjf") {
        return Result<SchedulingPolicy>::success(SchedulingPolicy::SJF);
    }
    if (name == "rr" || name == "round-robin") {
        return Result<SchedulingPolicy>::success(SchedulingPolicy::ROUND_ROBIN);
    }
    return Result<SchedulingPolicy>::failure(ErrorCode::INVALID_ARGUMENT,
                                             "unknown scheduling policy '" + name + "'");
}

} // namespace ossim
