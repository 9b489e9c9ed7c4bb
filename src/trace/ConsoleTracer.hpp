#pragma once

#include <iosfwd>

#include "TraceEvent.hpp"

namespace ossim {

/**
 * Renders trace events as one human readable line each.
 */
class ConsoleTracer {
public:
    explicit ConsoleTracer(std::ostream& out);

    void operator()(const TraceEvent& event) const;

    /** Wrap this tracer as a sink. The tracer must outlive the sink. */
    TraceSink sink() const;

private:
    std::ostream& out_;
};

} // namespace ossim
