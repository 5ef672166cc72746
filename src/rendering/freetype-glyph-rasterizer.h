#pragma once

#include <ft2build.h>
#include FT_FREETYPE_H

#include <filesystem>
#include <mutex>

#include "glyph-rasterizer.h"

class FreeTypeGlyphRasterizer : public GlyphRasterizer {
public:
    // Throws std::runtime_error if the font file can't be loaded
    explicit FreeTypeGlyphRasterizer(const std::filesystem::path& fontFilePath);
    ~FreeTypeGlyphRasterizer() override;

    FreeTypeGlyphRasterizer(const FreeTypeGlyphRasterizer&) = delete;
    FreeTypeGlyphRasterizer& operator=(const FreeTypeGlyphRasterizer&) = delete;

    GlyphRun rasterize(const std::string& utf8Text, double fontSize) const override;

private:
    FT_Library library = nullptr;
    FT_Face face = nullptr;
    // A face can only render one glyph at a time
    mutable std::mutex faceMutex;
};
