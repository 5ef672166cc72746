#include "freetype-glyph-rasterizer.h"

#include <fmt/format.h>
#include <utf8.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include "logging/logging.h"

using std::string;
using std::vector;
using std::filesystem::path;

FreeTypeGlyphRasterizer::FreeTypeGlyphRasterizer(const path& fontFilePath) {
    if (FT_Init_FreeType(&library)) {
        throw std::runtime_error("Failed to initialize FreeType.");
    }
    if (FT_New_Face(library, fontFilePath.u8string().c_str(), 0, &face)) {
        FT_Done_FreeType(library);
        throw std::runtime_error(fmt::format("Failed to load font {}.", fontFilePath.u8string()));
    }
    logging::debugFormat(
        "Loaded font {} ({} glyphs).", fontFilePath.u8string(), static_cast<long>(face->num_glyphs)
    );
}

FreeTypeGlyphRasterizer::~FreeTypeGlyphRasterizer() {
    FT_Done_Face(face);
    FT_Done_FreeType(library);
}

namespace {

struct PlacedGlyph {
    int left;
    int top;
    int width;
    int height;
    vector<uint8_t> pixels;
};

} // namespace

GlyphRun FreeTypeGlyphRasterizer::rasterize(const string& utf8Text, double fontSize) const {
    GlyphRun run;
    const int pixelSize = static_cast<int>(std::lround(fontSize));
    if (pixelSize <= 0 || utf8Text.empty()) return run;

    std::lock_guard<std::mutex> lock(faceMutex);
    if (FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(pixelSize))) {
        throw std::runtime_error(fmt::format("Font does not support size {}.", pixelSize));
    }
    const int ascender = static_cast<int>(face->size->metrics.ascender >> 6);
    const int descender = static_cast<int>(face->size->metrics.descender >> 6);

    // Lay out glyphs along the baseline
    vector<PlacedGlyph> glyphs;
    int penX = 0;
    auto it = utf8Text.begin();
    while (it != utf8Text.end()) {
        const uint32_t codepoint = utf8::next(it, utf8Text.end());
        const FT_UInt glyphIndex = FT_Get_Char_Index(face, codepoint);
        if (FT_Load_Glyph(face, glyphIndex, FT_LOAD_RENDER)) {
            logging::warnFormat("Failed to render character U+{:04X}.", codepoint);
            continue;
        }

        const FT_GlyphSlot slot = face->glyph;
        const FT_Bitmap& bitmap = slot->bitmap;
        PlacedGlyph glyph{
            penX + slot->bitmap_left,
            ascender - slot->bitmap_top,
            static_cast<int>(bitmap.width),
            static_cast<int>(bitmap.rows),
            {}
        };
        glyph.pixels.resize(static_cast<size_t>(glyph.width) * glyph.height);
        for (int y = 0; y < glyph.height; ++y) {
            const unsigned char* row = bitmap.buffer + static_cast<ptrdiff_t>(y) * bitmap.pitch;
            std::copy(row, row + glyph.width, glyph.pixels.begin() + y * glyph.width);
        }
        glyphs.push_back(std::move(glyph));
        penX += static_cast<int>(slot->advance.x >> 6);
    }

    run.width = std::max(penX, 1);
    run.height = std::max(ascender - descender, 1);
    run.coverage.assign(static_cast<size_t>(run.width) * run.height, 0);
    for (const PlacedGlyph& glyph : glyphs) {
        for (int y = 0; y < glyph.height; ++y) {
            for (int x = 0; x < glyph.width; ++x) {
                const int targetX = glyph.left + x;
                const int targetY = glyph.top + y;
                if (targetX < 0 || targetX >= run.width || targetY < 0 || targetY >= run.height) {
                    continue;
                }
                uint8_t& target = run.coverage[static_cast<size_t>(targetY) * run.width + targetX];
                target = std::max(target, glyph.pixels[static_cast<size_t>(y) * glyph.width + x]);
            }
        }
    }
    return run;
}
