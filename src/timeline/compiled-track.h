#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "core/value.h"
#include "easing.h"
#include "time/timed.h"

// Animates a property towards endValue over the time range it is attached to
struct Transition {
    Value endValue;
    Easing easing;

    bool operator==(const Transition& rhs) const {
        return endValue == rhs.endValue && easing == rhs.easing;
    }
};

std::ostream& operator<<(std::ostream& stream, const Transition& transition);

// All animations of one property of one object, ordered by time and free of overlaps.
class CompiledTrack {
public:
    // Throws std::invalid_argument if the segments are unordered or overlapping.
    CompiledTrack(
        size_t objectIndex,
        std::string propertyName,
        Value baseValue,
        std::vector<Timed<Transition>> segments
    );

    size_t getObjectIndex() const {
        return objectIndex;
    }

    const std::string& getPropertyName() const {
        return propertyName;
    }

    const Value& getBaseValue() const {
        return baseValue;
    }

    const std::vector<Timed<Transition>>& getSegments() const {
        return segments;
    }

    // The value of the property at the given time.
    // Before the first segment, this is the base value. Between segments, the property holds the
    // end value of the last completed segment.
    Value resolve(seconds time) const;

private:
    size_t objectIndex;
    std::string propertyName;
    Value baseValue;
    std::vector<Timed<Transition>> segments;
};
