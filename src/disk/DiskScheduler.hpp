#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/Result.hpp"
#include "trace/TraceEvent.hpp"

namespace ossim {

// Sweep direction for SCAN.
enum class SeekDirection {
    INCREASING, // toward higher track numbers ("right")
    DECREASING  // toward track 0 ("left")
};

// Accepts "right"/"increasing"/"up" and "left"/"decreasing"/"down".
Result<SeekDirection> parseSeekDirection(const std::string& name);
const char* toString(SeekDirection direction);

struct SeekSchedule {
    std::vector<int> sequence; // tracks in visiting order, head start excluded
    std::int64_t total_seek{0};
};

/**
 * Orders a batch of track requests and totals head movement. Every call
 * is a pure function of its arguments; the only state is the cylinder
 * count and the optional trace sink.
 */
class DiskScheduler {
public:
    /** Throws std::invalid_argument if totalCylinders is not positive. */
    explicit DiskScheduler(int totalCylinders = 200);

    void setTraceSink(TraceSink sink) { trace_ = std::move(sink); }

    int totalCylinders() const { return totalCylinders_; }

    /** Service requests strictly in input order. */
    Result<SeekSchedule> fcfs(const std::vector<int>& requests, int headStart) const;

    /**
     * Elevator sweep that runs to the end of the disk (track
     * totalCylinders - 1 or 0) before reversing.
     */
    Result<SeekSchedule> scan(const std::vector<int>& requests, int headStart,
                              SeekDirection direction) const;

private:
    Status validate(const std::vector<int>& requests, int headStart) const;
    SeekSchedule walk(std::vector<int> sequence, int headStart) const;

    int totalCylinders_;
    TraceSink trace_;
};

} // namespace ossim
