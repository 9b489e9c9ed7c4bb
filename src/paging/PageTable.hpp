#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>

#include "core/Result.hpp"
#include "trace/TraceEvent.hpp"

namespace ossim {

/**
 * Single-level page table mapping logical pages to physical frames.
 */
class PageTable {
public:
    /** Throws std::invalid_argument if pageSize is not positive. */
    explicit PageTable(std::int64_t pageSize = 4);

    void setTraceSink(TraceSink sink) { trace_ = std::move(sink); }

    /**
     * Map page to frame, replacing any existing mapping for page. Frames
     * whose physical addresses would not fit in 64 bits are rejected.
     */
    Status addMapping(std::int64_t page, std::int64_t frame);

    /** Drop the mapping for page. NOT_FOUND if it was not mapped. */
    Status removeMapping(std::int64_t page);

    /** Logical to physical. A missing page is a page fault (NOT_FOUND). */
    Result<std::int64_t> translate(std::int64_t logicalAddress) const;

    std::int64_t pageSize() const { return pageSize_; }
    std::size_t size() const { return table_.size(); }

private:
    std::int64_t pageSize_;
    std::map<std::int64_t, std::int64_t> table_;
    TraceSink trace_;
};

} // namespace ossim
