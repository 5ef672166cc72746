#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "exporters/pam-frame-exporter.h"

using namespace testing;
using std::string;
using std::filesystem::path;

namespace {

class PamFrameExporterTests : public Test {
protected:
    void SetUp() override {
        const TestInfo* testInfo = UnitTest::GetInstance()->current_test_info();
        directory = std::filesystem::temp_directory_path() / "beam-tests" / testInfo->name();
        std::filesystem::remove_all(directory);
    }

    void TearDown() override {
        std::filesystem::remove_all(directory);
    }

    static string readFile(const path& filePath) {
        std::ifstream file(filePath, std::ios::in | std::ios::binary);
        return string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    path directory;
};

const string header = "P7\nWIDTH 3\nHEIGHT 2\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";

} // namespace

TEST_F(PamFrameExporterTests, createsDirectory) {
    const PamFrameExporter exporter(directory / "nested");
    EXPECT_TRUE(std::filesystem::is_directory(directory / "nested"));
}

TEST_F(PamFrameExporterTests, namesFilesByIndex) {
    const PamFrameExporter exporter(directory);
    EXPECT_EQ((directory / "frame_00000.pam").string(), exporter.getFilePath(0).string());
    EXPECT_EQ((directory / "frame_00042.pam").string(), exporter.getFilePath(42).string());

    const PamFrameExporter offsetExporter(directory, 100);
    EXPECT_EQ((directory / "frame_00105.pam").string(), offsetExporter.getFilePath(5).string());
}

TEST_F(PamFrameExporterTests, writesPamFile) {
    PixelBuffer pixels(3, 2, Color(0x10, 0x20, 0x30));
    pixels.blendPixel(2, 1, Color(0xFF, 0xFF, 0xFF), 1.0);

    PamFrameExporter exporter(directory);
    exporter.receiveFrame(RenderedFrame(7, 1_s, pixels));

    const string content = readFile(directory / "frame_00007.pam");
    ASSERT_EQ(header.size() + 3 * 2 * 4, content.size());
    EXPECT_EQ(header, content.substr(0, header.size()));

    const string data = content.substr(header.size());
    EXPECT_EQ(string("\x10\x20\x30\xFF", 4), data.substr(0, 4));
    EXPECT_EQ(string("\xFF\xFF\xFF\xFF", 4), data.substr(20, 4));
}

TEST_F(PamFrameExporterTests, reportsWriteErrors) {
    const PixelBuffer pixels(3, 2, Color(0, 0, 0));
    EXPECT_THROW(
        writePamFile(pixels, directory / "missing" / "frame.pam"), std::runtime_error
    );
}
