#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "core/Result.hpp"
#include "trace/TraceEvent.hpp"

namespace ossim {

// Contiguous run of the simulated address space. owner is engaged only
// while the extent is allocated.
struct MemoryExtent {
    std::int64_t start{0};
    std::int64_t size{0};
    bool free{true};
    std::optional<int> owner;

    std::int64_t end() const { return start + size; }

    bool operator==(const MemoryExtent& other) const {
        return start == other.start && size == other.size && free == other.free &&
               owner == other.owner;
    }
};

/**
 * First-fit contiguous allocator over [0, total_memory).
 *
 * The extents always partition the address space in address order with no
 * gaps or overlaps, and after every public call no two neighbours are both
 * free. Each process owns at most one extent.
 */
class MemoryAllocator {
public:
    /** Throws std::invalid_argument if totalMemory is not positive. */
    explicit MemoryAllocator(std::int64_t totalMemory);

    void setTraceSink(TraceSink sink) { m_trace = std::move(sink); }

    /**
     * Place size units for processId in the first free extent that fits,
     * splitting off the unused tail as a new free extent.
     * @return start address of the allocation
     */
    Result<std::int64_t> allocate(int processId, std::int64_t size);

    /** Free the extent owned by processId and merge free neighbours. */
    Status deallocate(int processId);

    /**
     * Merge every maximal run of adjacent free extents in one pass.
     * @return number of extents removed by merging
     */
    std::size_t coalesce();

    std::vector<MemoryExtent> snapshot() const { return m_extents; }

    std::int64_t totalMemory() const { return m_total; }
    std::int64_t freeMemory() const;
    std::int64_t largestFreeExtent() const;

private:
    void emit(TraceEventType type, int pid, std::int64_t first, std::int64_t second) const;

    std::int64_t m_total;
    std::vector<MemoryExtent> m_extents;
    TraceSink m_trace;
};

} // namespace ossim
