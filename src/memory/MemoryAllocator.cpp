#include "MemoryAllocator.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace ossim {

MemoryAllocator::MemoryAllocator(std::int64_t totalMemory) : m_total(totalMemory) {
    if (m_total <= 0) {
        throw std::invalid_argument("total memory must be positive, got " +
                                    std::to_string(totalMemory));
    }
    m_extents.push_back(MemoryExtent{0, m_total, true, std::nullopt});
}

Result<std::int64_t> MemoryAllocator::allocate(int processId, std::int64_t size) {
    if (size <= 0) {
        return Result<std::int64_t>::failure(ErrorCode::INVALID_ARGUMENT,
                                             "allocation size must be positive, got " +
                                                 std::to_string(size));
    }
    auto owned = std::find_if(m_extents.begin(), m_extents.end(), [processId](const MemoryExtent& e) {
        return !e.free && e.owner == processId;
    });
    if (owned != m_extents.end()) {
        return Result<std::int64_t>::failure(ErrorCode::INVALID_ARGUMENT,
                                             "process " + std::to_string(processId) +
                                                 " already owns an extent");
    }

    auto it = std::find_if(m_extents.begin(), m_extents.end(), [size](const MemoryExtent& e) {
        return e.free && e.size >= size;
    });
    if (it == m_extents.end()) {
        emit(TraceEventType::ALLOCATION_FAILED, processId, size, 0);
        return Result<std::int64_t>::failure(ErrorCode::INSUFFICIENT_MEMORY,
                                             "no free extent of " + std::to_string(size) +
                                                 " units for process " + std::to_string(processId));
    }

    std::int64_t address = it->start;
    if (it->size > size) {
        MemoryExtent remainder{it->start + size, it->size - size, true, std::nullopt};
        it->size = size;
        // insert() invalidates it, so finish with it first
        it->free = false;
        it->owner = processId;
        m_extents.insert(std::next(it), remainder);
        emit(TraceEventType::EXTENT_SPLIT, processId, remainder.start, remainder.size);
    } else {
        it->free = false;
        it->owner = processId;
    }
    emit(TraceEventType::EXTENT_ALLOCATED, processId, address, size);
    return Result<std::int64_t>::success(address);
}

Status MemoryAllocator::deallocate(int processId) {
    auto it = std::find_if(m_extents.begin(), m_extents.end(), [processId](const MemoryExtent& e) {
        return !e.free && e.owner == processId;
    });
    if (it == m_extents.end()) {
        return Status::failure(ErrorCode::NOT_FOUND,
                               "process " + std::to_string(processId) + " owns no extent");
    }
    it->free = true;
    it->owner.reset();
    emit(TraceEventType::EXTENT_FREED, processId, it->start, it->size);
    coalesce();
    return Status::success();
}

std::size_t MemoryAllocator::coalesce() {
    std::vector<MemoryExtent> merged;
    merged.reserve(m_extents.size());
    for (const auto& extent : m_extents) {
        if (!merged.empty() && merged.back().free && extent.free) {
            merged.back().size += extent.size;
            emit(TraceEventType::EXTENTS_MERGED, 0, merged.back().start, merged.back().size);
        } else {
            merged.push_back(extent);
        }
    }
    std::size_t removed = m_extents.size() - merged.size();
    m_extents = std::move(merged);
    return removed;
}

std::int64_t MemoryAllocator::freeMemory() const {
    std::int64_t total = 0;
    for (const auto& e : m_extents) {
        if (e.free) {
            total += e.size;
        }
    }
    return total;
}

std::int64_t MemoryAllocator::largestFreeExtent() const {
    std::int64_t largest = 0;
    for (const auto& e : m_extents) {
        if (e.free) {
            largest = std::max(largest, e.size);
        }
    }
    return largest;
}

void MemoryAllocator::emit(TraceEventType type, int pid, std::int64_t first, std::int64_t second) const {
    if (m_trace) {
        m_trace(TraceEvent{type, 0, pid, first, second});
    }
}

} // namespace ossim
