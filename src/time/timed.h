#pragma once

#include <ostream>

#include "time-range.h"

template <typename TValue>
class Timed {
public:
    Timed(TimeRange::time_type start, TimeRange::time_type end, const TValue& value) :
        Timed(TimeRange(start, end), value) {}

    Timed(const TimeRange& timeRange, const TValue& value) :
        timeRange(timeRange),
        value(value) {}

    Timed(const Timed&) = default;
    Timed(Timed&&) = default;

    Timed& operator=(const Timed&) = default;
    Timed& operator=(Timed&&) = default;

    const TimeRange& getTimeRange() const {
        return timeRange;
    }

    TimeRange::time_type getStart() const {
        return timeRange.getStart();
    }

    TimeRange::time_type getEnd() const {
        return timeRange.getEnd();
    }

    TimeRange::time_type getDuration() const {
        return timeRange.getDuration();
    }

    const TValue& getValue() const {
        return value;
    }

    bool operator==(const Timed& rhs) const {
        return timeRange == rhs.timeRange && value == rhs.value;
    }

    bool operator!=(const Timed& rhs) const {
        return !operator==(rhs);
    }

private:
    TimeRange timeRange;
    TValue value;
};

template <typename T>
std::ostream& operator<<(std::ostream& stream, const Timed<T>& timedValue) {
    return stream << "Timed(" << formatDuration(timedValue.getStart()) << ", "
                  << formatDuration(timedValue.getEnd()) << ", " << timedValue.getValue() << ")";
}
