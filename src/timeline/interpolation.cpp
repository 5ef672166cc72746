#include "interpolation.h"

#include <fmt/format.h>

#include <boost/algorithm/clamp.hpp>
#include <cmath>

#include "core/errors.h"

using std::string;

double interpolate(double start, double end, double progress) {
    if (progress <= 0) return start;
    if (progress >= 1) return end;
    return start + (end - start) * progress;
}

Point interpolate(Point start, Point end, double progress) {
    return Point(interpolate(start.x, end.x, progress), interpolate(start.y, end.y, progress));
}

namespace {

uint8_t interpolateChannel(uint8_t start, uint8_t end, double progress) {
    const double value = std::round(interpolate(double(start), double(end), progress));
    return static_cast<uint8_t>(boost::algorithm::clamp(value, 0.0, 255.0));
}

class ValueInterpolator : public boost::static_visitor<Value> {
public:
    explicit ValueInterpolator(double progress) :
        progress(progress) {}

    template <typename T, typename U>
    Value operator()(const T& start, const U& end) const {
        throw InvariantViolation(fmt::format(
            "Cannot interpolate from {} to {}.",
            ValueTypeConverter::get().toString(getValueType(Value(start))),
            ValueTypeConverter::get().toString(getValueType(Value(end)))
        ));
    }

    template <typename T>
    Value operator()(const T& start, const T& end) const {
        return interpolate(start, end, progress);
    }

    Value operator()(const string& start, const string& end) const {
        return progress >= 1 ? end : start;
    }

private:
    double progress;
};

} // namespace

Color interpolate(Color start, Color end, double progress) {
    return Color(
        interpolateChannel(start.r, end.r, progress),
        interpolateChannel(start.g, end.g, progress),
        interpolateChannel(start.b, end.b, progress)
    );
}

Value interpolate(const Value& start, const Value& end, double progress) {
    return boost::apply_visitor(ValueInterpolator(progress), start, end);
}
