#pragma once

#include "core/camera.h"
#include "frames/frame-snapshot.h"
#include "glyph-rasterizer.h"
#include "pixel-buffer.h"

// Draws all objects of a snapshot in order onto the camera's background.
// Text objects are skipped if no glyph rasterizer is given.
// Throws InvariantViolation if an object lacks a required property or has one of the wrong type.
PixelBuffer renderSnapshot(
    const FrameSnapshot& snapshot, const Camera& camera, const GlyphRasterizer* glyphRasterizer
);
