#pragma once

#include <cstdint>
#include <vector>

#include "core/value.h"

struct Rgba {
    uint8_t r, g, b, a;

    bool operator==(const Rgba& rhs) const {
        return r == rhs.r && g == rhs.g && b == rhs.b && a == rhs.a;
    }
    bool operator!=(const Rgba& rhs) const {
        return !operator==(rhs);
    }
};

std::ostream& operator<<(std::ostream& stream, const Rgba& rgba);

// RGBA8 pixels, row-major, origin at the top left
class PixelBuffer {
public:
    // Throws std::invalid_argument for non-positive dimensions
    PixelBuffer(int width, int height, Color background);

    int getWidth() const {
        return width;
    }

    int getHeight() const {
        return height;
    }

    const std::vector<uint8_t>& getData() const {
        return data;
    }

    Rgba getPixel(int x, int y) const;

    // Source-over blending of an opaque color with the given alpha in [0, 1].
    // Pixels outside the buffer are ignored.
    void blendPixel(int x, int y, Color color, double alpha);

private:
    int width;
    int height;
    std::vector<uint8_t> data;
};
