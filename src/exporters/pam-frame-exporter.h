#pragma once

#include <filesystem>

#include "frame-sink.h"

// Writes each frame as a Netpbm PAM image (RGB_ALPHA) named frame_NNNNN.pam,
// where NNNNN is the frame index plus the index offset.
class PamFrameExporter : public FrameSink {
public:
    // Creates the output directory if needed
    PamFrameExporter(std::filesystem::path directory, int indexOffset = 0);

    void receiveFrame(const RenderedFrame& frame) override;

    std::filesystem::path getFilePath(int frameIndex) const;

private:
    std::filesystem::path directory;
    int indexOffset;
};

void writePamFile(const PixelBuffer& pixels, const std::filesystem::path& filePath);
