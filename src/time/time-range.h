#pragma once

#include "seconds.h"

class TimeRange {
public:
    using time_type = seconds;

    TimeRange();
    TimeRange(time_type start, time_type end);
    TimeRange(const TimeRange&) = default;
    TimeRange(TimeRange&&) = default;

    TimeRange& operator=(const TimeRange&) = default;
    TimeRange& operator=(TimeRange&&) = default;

    time_type getStart() const;
    time_type getEnd() const;
    time_type getDuration() const;
    bool empty() const;

    // True if the ranges overlap by a positive duration, if one is an instant strictly inside
    // the other, or if both are instants at the same time. Ranges that merely touch do not
    // conflict, so an instant at T may precede a range starting at T.
    bool conflictsWith(const TimeRange& other) const;

    // Orders by start, then by end
    bool operator<(const TimeRange& rhs) const;
    bool operator==(const TimeRange& rhs) const;
    bool operator!=(const TimeRange& rhs) const;

private:
    time_type start, end;
};

std::ostream& operator<<(std::ostream& stream, const TimeRange& timeRange);
