#ifndef OSSIM_PROCESS_INFO_HPP
#define OSSIM_PROCESS_INFO_HPP

#include <string>
#include <utility>

#include "ProcessState.hpp"

namespace ossim {

/**
 * Process descriptor handed to the CPU scheduler. Times are logical units.
 *
 * remaining_time starts equal to burst_time and only round robin
 * decrements it. waiting_time and turnaround_time are filled in when the
 * process terminates.
 */
struct ProcessInfo {
    int process_id{0};
    std::string name;
    int priority{0};
    int burst_time{0};
    int arrival_time{0};
    ProcessState state{ProcessState::NEW};
    int waiting_time{0};
    int turnaround_time{0};
    int remaining_time{0};

    ProcessInfo() = default;
    ProcessInfo(int pid, std::string process_name, int prio, int burst, int arrival)
        : process_id(pid), name(std::move(process_name)), priority(prio),
          burst_time(burst), arrival_time(arrival), remaining_time(burst) {}
};

} // namespace ossim

#endif // OSSIM_PROCESS_INFO_HPP
