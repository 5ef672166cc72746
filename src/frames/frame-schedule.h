#pragma once

#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/irange.hpp>

#include "time/seconds.h"

// The sample times of a scene: one frame every 1/frameRate seconds, starting at 0 and including
// a final frame at the very end of the scene.
class FrameSchedule {
public:
    // Throws std::invalid_argument if the frame rate isn't positive or the duration is negative.
    FrameSchedule(seconds duration, double frameRate);

    seconds getDuration() const {
        return duration;
    }

    double getFrameRate() const {
        return frameRate;
    }

    int getFrameCount() const {
        return frameCount;
    }

    // The time of frame k is k / frameRate, clamped to the duration
    seconds getFrameTime(int frameIndex) const;

    boost::integer_range<int> getFrameIndices() const {
        return boost::irange(0, frameCount);
    }

    // Lazily computed; can be iterated any number of times
    auto getSampleTimes() const {
        const FrameSchedule schedule = *this;
        return getFrameIndices() | boost::adaptors::transformed([schedule](int frameIndex) {
                   return schedule.getFrameTime(frameIndex);
               });
    }

private:
    seconds duration;
    double frameRate;
    int frameCount;
};
