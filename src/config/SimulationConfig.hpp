#ifndef OSSIM_SIMULATION_CONFIG_HPP
#define OSSIM_SIMULATION_CONFIG_HPP

#include <cstdint>
#include <iosfwd>
#include <string>

#include "core/Result.hpp"
#include "disk/DiskScheduler.hpp"
#include "process/ProcessEnums.hpp"

namespace ossim {

/**
 * Parameters for one simulation run. Defaults reproduce the classic
 * textbook scenarios.
 *
 * File format: one "key value" or "key=value" per line, '#' starts a
 * comment line. Recognized keys: total-memory, scheduler, quantum,
 * disk-cylinders, disk-head, disk-direction, page-size, trace.
 */
struct SimulationConfig {
    std::int64_t totalMemory = 100;
    SchedulingPolicy scheduler = SchedulingPolicy::FCFS;
    int quantum = 2;
    int diskCylinders = 200;
    int diskHead = 53;
    SeekDirection diskDirection = SeekDirection::INCREASING;
    std::int64_t pageSize = 4;
    bool trace = true;

    Status loadFromFile(const std::string& filename);
    Status loadFromStream(std::istream& in);

    /** Cross-field checks. Run after every load. */
    Status validate() const;

    void display(std::ostream& out) const;
};

} // namespace ossim

#endif // OSSIM_SIMULATION_CONFIG_HPP
