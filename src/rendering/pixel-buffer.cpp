#include "pixel-buffer.h"

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>

std::ostream& operator<<(std::ostream& stream, const Rgba& rgba) {
    return stream << fmt::format("Rgba({}, {}, {}, {})", rgba.r, rgba.g, rgba.b, rgba.a);
}

PixelBuffer::PixelBuffer(int width, int height, Color background) :
    width(width),
    height(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument(
            fmt::format("Invalid pixel buffer size {}x{}.", width, height)
        );
    }

    data.resize(static_cast<size_t>(width) * height * 4);
    for (size_t i = 0; i < data.size(); i += 4) {
        data[i] = background.r;
        data[i + 1] = background.g;
        data[i + 2] = background.b;
        data[i + 3] = 0xFF;
    }
}

Rgba PixelBuffer::getPixel(int x, int y) const {
    if (x < 0 || x >= width || y < 0 || y >= height) {
        throw std::out_of_range(fmt::format("Pixel ({}, {}) is outside the buffer.", x, y));
    }
    const uint8_t* pixel = &data[(static_cast<size_t>(y) * width + x) * 4];
    return Rgba{pixel[0], pixel[1], pixel[2], pixel[3]};
}

namespace {

uint8_t blendChannel(uint8_t source, uint8_t destination, double alpha) {
    return static_cast<uint8_t>(std::lround(source * alpha + destination * (1 - alpha)));
}

} // namespace

void PixelBuffer::blendPixel(int x, int y, Color color, double alpha) {
    if (x < 0 || x >= width || y < 0 || y >= height || alpha <= 0) return;
    if (alpha > 1) alpha = 1;

    uint8_t* pixel = &data[(static_cast<size_t>(y) * width + x) * 4];
    pixel[0] = blendChannel(color.r, pixel[0], alpha);
    pixel[1] = blendChannel(color.g, pixel[1], alpha);
    pixel[2] = blendChannel(color.b, pixel[2], alpha);
    pixel[3] = blendChannel(0xFF, pixel[3], alpha);
}
