#pragma once

#include <cstdint>
#include <string>
#include <vector>

// A line of text rendered to an 8-bit coverage bitmap
struct GlyphRun {
    int width = 0;
    int height = 0;
    // Row-major, 0 = empty, 255 = fully covered
    std::vector<uint8_t> coverage;

    uint8_t getCoverage(int x, int y) const {
        if (x < 0 || x >= width || y < 0 || y >= height) return 0;
        return coverage[static_cast<size_t>(y) * width + x];
    }
};

// Renders text into coverage bitmaps. Implementations must be safe to call from several threads.
class GlyphRasterizer {
public:
    virtual ~GlyphRasterizer() = default;
    virtual GlyphRun rasterize(const std::string& utf8Text, double fontSize) const = 0;
};
