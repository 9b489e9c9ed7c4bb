#include "PageTable.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace ossim {

PageTable::PageTable(std::int64_t pageSize) : pageSize_(pageSize) {
    if (pageSize_ <= 0) {
        throw std::invalid_argument("page size must be positive, got " + std::to_string(pageSize));
    }
}

Status PageTable::addMapping(std::int64_t page, std::int64_t frame) {
    if (page < 0 || frame < 0) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "page and frame numbers must be non-negative");
    }
    // translate() computes frame * pageSize + offset
    if (frame > (std::numeric_limits<std::int64_t>::max() - (pageSize_ - 1)) / pageSize_) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT,
                               "frame " + std::to_string(frame) + " is beyond the addressable range");
    }
    table_[page] = frame;
    return Status::success();
}

Status PageTable::removeMapping(std::int64_t page) {
    if (table_.erase(page) == 0) {
        return Status::failure(ErrorCode::NOT_FOUND, "page " + std::to_string(page) + " is not mapped");
    }
    return Status::success();
}

Result<std::int64_t> PageTable::translate(std::int64_t logicalAddress) const {
    if (logicalAddress < 0) {
        return Result<std::int64_t>::failure(ErrorCode::INVALID_ARGUMENT,
                                             "negative logical address " +
                                                 std::to_string(logicalAddress));
    }
    const std::int64_t page = logicalAddress / pageSize_;
    const std::int64_t offset = logicalAddress % pageSize_;

    auto it = table_.find(page);
    if (it == table_.end()) {
        if (trace_) {
            trace_(TraceEvent{TraceEventType::PAGE_FAULT, 0, static_cast<int>(page), logicalAddress, 0});
        }
        return Result<std::int64_t>::failure(ErrorCode::NOT_FOUND,
                                             "page fault: page " + std::to_string(page) +
                                                 " not in memory");
    }
    const std::int64_t physical = it->second * pageSize_ + offset;
    if (trace_) {
        trace_(TraceEvent{TraceEventType::PAGE_TRANSLATED, 0, static_cast<int>(page), logicalAddress, physical});
    }
    return Result<std::int64_t>::success(physical);
}

} // namespace ossim
