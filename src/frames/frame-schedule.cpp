#include "frame-schedule.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

FrameSchedule::FrameSchedule(seconds duration, double frameRate) :
    duration(duration),
    frameRate(frameRate) {
    if (!(frameRate > 0) || std::isinf(frameRate)) {
        throw std::invalid_argument(
            fmt::format("Frame rate must be a positive number, but is {}.", frameRate)
        );
    }
    if (duration < seconds::zero()) {
        throw std::invalid_argument(
            fmt::format("Duration must not be negative, but is {}.", formatDuration(duration))
        );
    }

    // Tolerance keeps products like 3s * 30fps from rounding up to an extra frame
    const double lastFrameIndex = std::ceil(duration.count() * frameRate - 1e-9);
    frameCount = static_cast<int>(std::max(lastFrameIndex, 0.0)) + 1;
}

seconds FrameSchedule::getFrameTime(int frameIndex) const {
    if (frameIndex < 0 || frameIndex >= frameCount) {
        throw std::out_of_range(fmt::format(
            "Frame index {} is out of range. The schedule has {} frames.", frameIndex, frameCount
        ));
    }
    return std::min(seconds(frameIndex / frameRate), duration);
}
