#include "DiskScheduler.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace ossim {

Result<SeekDirection> parseSeekDirection(const std::string& name) {
    if (name == "right" || name == "increasing" || name == "up") {
        return Result<SeekDirection>::success(SeekDirection::INCREASING);
    }
    if (name == "left" || name == "decreasing" || name == "down") {
        return Result<SeekDirection>::success(SeekDirection::DECREASING);
    }
    return Result<SeekDirection>::failure(ErrorCode::INVALID_ARGUMENT,
                                          "unknown seek direction '" + name + "'");
}

const char* toString(SeekDirection direction) {
    switch (direction) {
    case SeekDirection::INCREASING: return "right";
    case SeekDirection::DECREASING: return "left";
    }
    return "unknown";
}

DiskScheduler::DiskScheduler(int totalCylinders) : totalCylinders_(totalCylinders) {
    if (totalCylinders_ <= 0) {
        throw std::invalid_argument("cylinder count must be positive, got " +
                                    std::to_string(totalCylinders));
    }
}

Result<SeekSchedule> DiskScheduler::fcfs(const std::vector<int>& requests, int headStart) const {
    Status status = validate(requests, headStart);
    if (!status.ok()) {
        return Result<SeekSchedule>::failure(status);
    }
    return Result<SeekSchedule>::success(walk(requests, headStart));
}

Result<SeekSchedule> DiskScheduler::scan(const std::vector<int>& requests, int headStart,
                                         SeekDirection direction) const {
    if (direction != SeekDirection::INCREASING && direction != SeekDirection::DECREASING) {
        return Result<SeekSchedule>::failure(ErrorCode::INVALID_ARGUMENT, "unknown seek direction");
    }
    Status status = validate(requests, headStart);
    if (!status.ok()) {
        return Result<SeekSchedule>::failure(status);
    }

    std::vector<int> left;
    std::vector<int> right;
    for (int track : requests) {
        (track < headStart ? left : right).push_back(track);
    }
    std::sort(left.begin(), left.end());
    std::sort(right.begin(), right.end());

    std::vector<int> sequence;
    sequence.reserve(requests.size() + 1);
    if (direction == SeekDirection::INCREASING) {
        sequence.insert(sequence.end(), right.begin(), right.end());
        sequence.push_back(totalCylinders_ - 1);
        sequence.insert(sequence.end(), left.rbegin(), left.rend());
    } else {
        sequence.insert(sequence.end(), left.rbegin(), left.rend());
        sequence.push_back(0);
        sequence.insert(sequence.end(), right.begin(), right.end());
    }
    return Result<SeekSchedule>::success(walk(std::move(sequence), headStart));
}

Status DiskScheduler::validate(const std::vector<int>& requests, int headStart) const {
    if (headStart < 0 || headStart >= totalCylinders_) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "head position " + std::to_string(headStart) + " outside [0, " +
                                   std::to_string(totalCylinders_) + ")");
    }
    for (int track : requests) {
        if (track < 0 || track >= totalCylinders_) {
            return Status::failure(ErrorCode::INVALID_ARGUMENT,
                                   "track " + std::to_string(track) + " outside [0, " +
                                       std::to_string(totalCylinders_) + ")");
        }
    }
    return Status::success();
}

SeekSchedule DiskScheduler::walk(std::vector<int> sequence, int headStart) const {
    SeekSchedule schedule;
    int current = headStart;
    for (int track : sequence) {
        int seek = std::abs(track - current);
        schedule.total_seek += seek;
        if (trace_) {
            trace_(TraceEvent{TraceEventType::HEAD_MOVED, 0, track, current, seek});
        }
        current = track;
    }
    schedule.sequence = std::move(sequence);
    return schedule;
}

} // namespace ossim
