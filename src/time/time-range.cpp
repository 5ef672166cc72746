#include "time-range.h"

#include <fmt/format.h>

#include <algorithm>
#include <ostream>
#include <stdexcept>

using time_type = TimeRange::time_type;

TimeRange::TimeRange() :
    start(time_type::zero()),
    end(time_type::zero()) {}

TimeRange::TimeRange(time_type start, time_type end) :
    start(start),
    end(end) {
    if (start > end) {
        throw std::invalid_argument(fmt::format(
            "Time range start must not be greater than end. Start: {0}, end: {1}",
            formatDuration(start),
            formatDuration(end)
        ));
    }
}

time_type TimeRange::getStart() const {
    return start;
}

time_type TimeRange::getEnd() const {
    return end;
}

time_type TimeRange::getDuration() const {
    return end - start;
}

bool TimeRange::empty() const {
    return start == end;
}

bool TimeRange::conflictsWith(const TimeRange& other) const {
    // Two instants at the same time
    if (empty() && other.empty()) return start == other.start;

    return std::max(start, other.start) < std::min(end, other.end)
        // An empty range strictly inside a non-empty one
        || (empty() && other.start < start && start < other.end)
        || (other.empty() && start < other.start && other.start < end);
}

bool TimeRange::operator<(const TimeRange& rhs) const {
    return start < rhs.start || (start == rhs.start && end < rhs.end);
}

bool TimeRange::operator==(const TimeRange& rhs) const {
    return start == rhs.start && end == rhs.end;
}

bool TimeRange::operator!=(const TimeRange& rhs) const {
    return !operator==(rhs);
}

std::ostream& operator<<(std::ostream& stream, const TimeRange& timeRange) {
    return stream << "TimeRange(" << formatDuration(timeRange.getStart()) << ", "
                  << formatDuration(timeRange.getEnd()) << ")";
}
