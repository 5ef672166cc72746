#include "compiled-track.h"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "interpolation.h"

using std::string;
using std::vector;

std::ostream& operator<<(std::ostream& stream, const Transition& transition) {
    return stream << formatValue(transition.endValue) << " with " << transition.easing;
}

CompiledTrack::CompiledTrack(
    size_t objectIndex, string propertyName, Value baseValue, vector<Timed<Transition>> segments
) :
    objectIndex(objectIndex),
    propertyName(std::move(propertyName)),
    baseValue(std::move(baseValue)),
    segments(std::move(segments)) {
    for (size_t i = 1; i < this->segments.size(); ++i) {
        const TimeRange& previous = this->segments[i - 1].getTimeRange();
        const TimeRange& current = this->segments[i].getTimeRange();
        if (current < previous || current.conflictsWith(previous)) {
            throw std::invalid_argument(fmt::format(
                "Track segments for property '{}' must be ordered and must not overlap.",
                this->propertyName
            ));
        }
    }
}

Value CompiledTrack::resolve(seconds time) const {
    // Find the last segment starting at or before the given time
    const auto next = std::upper_bound(
        segments.begin(),
        segments.end(),
        time,
        [](seconds t, const Timed<Transition>& segment) { return t < segment.getStart(); }
    );
    if (next == segments.begin()) {
        return baseValue;
    }

    const auto current = std::prev(next);
    const Transition& transition = current->getValue();
    if (time >= current->getEnd()) {
        return transition.endValue;
    }

    const Value& startValue =
        current == segments.begin() ? baseValue : std::prev(current)->getValue().endValue;
    const double progress = (time - current->getStart()) / current->getDuration();
    return interpolate(startValue, transition.endValue, applyEasing(transition.easing, progress));
}
