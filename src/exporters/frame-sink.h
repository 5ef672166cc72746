#pragma once

#include <utility>

#include "rendering/pixel-buffer.h"
#include "time/seconds.h"

struct RenderedFrame {
    RenderedFrame(int index, seconds time, PixelBuffer pixels) :
        index(index),
        time(time),
        pixels(std::move(pixels)) {}

    // Position of the frame within its scene. Frames may be delivered in any order.
    int index;
    seconds time;
    PixelBuffer pixels;
};

// Receives rendered frames. Called concurrently from render workers.
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void receiveFrame(const RenderedFrame& frame) = 0;
};
