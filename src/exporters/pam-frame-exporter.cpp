#include "pam-frame-exporter.h"

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>
#include <utility>

using std::filesystem::path;

PamFrameExporter::PamFrameExporter(path directory, int indexOffset) :
    directory(std::move(directory)),
    indexOffset(indexOffset) {
    try {
        create_directories(this->directory);
    } catch (const std::filesystem::filesystem_error&) {
        std::throw_with_nested(std::runtime_error(
            fmt::format("Error creating output directory {}.", this->directory.u8string())
        ));
    }
}

path PamFrameExporter::getFilePath(int frameIndex) const {
    return directory / fmt::format("frame_{:05d}.pam", frameIndex + indexOffset);
}

void PamFrameExporter::receiveFrame(const RenderedFrame& frame) {
    // Every frame goes to its own file, so concurrent calls don't interfere
    writePamFile(frame.pixels, getFilePath(frame.index));
}

void writePamFile(const PixelBuffer& pixels, const path& filePath) {
    try {
        std::ofstream file;
        file.exceptions(std::ofstream::failbit | std::ofstream::badbit);
        file.open(filePath, std::ios::out | std::ios::binary);

        file << fmt::format(
            "P7\nWIDTH {}\nHEIGHT {}\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n",
            pixels.getWidth(),
            pixels.getHeight()
        );
        const auto& data = pixels.getData();
        file.write(
            reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size())
        );
    } catch (const std::exception&) {
        std::throw_with_nested(
            std::runtime_error(fmt::format("Error writing frame file {}.", filePath.u8string()))
        );
    }
}
