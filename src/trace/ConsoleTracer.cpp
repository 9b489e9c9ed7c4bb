#include "ConsoleTracer.hpp"

#include <ostream>

namespace ossim {

ConsoleTracer::ConsoleTracer(std::ostream& out) : out_(out) {}

TraceSink ConsoleTracer::sink() const {
    return [this](const TraceEvent& event) { (*this)(event); };
}

void ConsoleTracer::operator()(const TraceEvent& e) const {
    switch (e.type) {
    case TraceEventType::PROCESS_ADMITTED:
        out_ << "[Time " << e.time << "] Process P" << e.subject << " added to ready queue";
        break;
    case TraceEventType::PROCESS_DISPATCHED:
        out_ << "[Time " << e.time << "] Running P" << e.subject << " for " << e.first << " units";
        break;
    case TraceEventType::PROCESS_PREEMPTED:
        out_ << "[Time " << e.time << "] P" << e.subject << " preempted, " << e.first << " units left";
        break;
    case TraceEventType::PROCESS_TERMINATED:
        out_ << "[Time " << e.time << "] P" << e.subject << " terminated (waiting " << e.first
             << ", turnaround " << e.second << ")";
        break;
    case TraceEventType::EXTENT_ALLOCATED:
        out_ << "Allocated " << e.second << "KB to Process " << e.subject << " at address " << e.first;
        break;
    case TraceEventType::EXTENT_SPLIT:
        out_ << "Split extent, free remainder at " << e.first << " (" << e.second << "KB)";
        break;
    case TraceEventType::ALLOCATION_FAILED:
        out_ << "Failed to allocate " << e.first << "KB to Process " << e.subject;
        break;
    case TraceEventType::EXTENT_FREED:
        out_ << "Deallocated " << e.second << "KB at address " << e.first << " for Process " << e.subject;
        break;
    case TraceEventType::EXTENTS_MERGED:
        out_ << "Merged free extents at " << e.first << " into " << e.second << "KB";
        break;
    case TraceEventType::PROCESS_FINISHED:
        out_ << "P" << e.subject << " can finish safely";
        break;
    case TraceEventType::DEADLOCK_DETECTED:
        out_ << "Deadlock detected, " << e.first << " process(es) cannot finish";
        break;
    case TraceEventType::HEAD_MOVED:
        out_ << "Move from " << e.first << " to " << e.subject << " (seek: " << e.second << ")";
        break;
    case TraceEventType::PAGE_TRANSLATED:
        out_ << "Logical " << e.first << " -> Page " << e.subject << " -> Physical " << e.second;
        break;
    case TraceEventType::PAGE_FAULT:
        out_ << "Page fault! Page " << e.subject << " not in memory (logical " << e.first << ")";
        break;
    case TraceEventType::SEMAPHORE_ACQUIRED:
        out_ << "P" << e.subject << " acquired semaphore";
        break;
    case TraceEventType::SEMAPHORE_BLOCKED:
        out_ << "P" << e.subject << " is waiting...";
        break;
    case TraceEventType::SEMAPHORE_RELEASED:
        out_ << "Semaphore released (value " << e.first << ")";
        break;
    case TraceEventType::SEMAPHORE_WOKEN:
        out_ << "P" << e.subject << " woken up";
        break;
    }
    out_ << '\n';
}

} // namespace ossim
