#include <gmock/gmock.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <vector>

#include "core/errors.h"
#include "lib/beam-lib.h"
#include "script/script-parser.h"
#include "tools/exceptions.h"

using namespace testing;
using std::map;
using std::string;
using std::vector;

namespace {

CompiledScript compileText(const string& text) {
    return compileScript(parseScript(text));
}

// Keeps the pixel data of every received frame, by index
class CollectingFrameSink : public FrameSink {
public:
    void receiveFrame(const RenderedFrame& frame) override {
        std::lock_guard<std::mutex> lock(mutex);
        frames[frame.index] = frame.pixels.getData();
        times[frame.index] = frame.time;
    }

    std::mutex mutex;
    map<int, vector<uint8_t>> frames;
    map<int, seconds> times;
};

const string animatedScript =
    "camera { width: 64, height: 48 }\n"
    "scene \"Intro\" {\n"
    "    circle \"c\" { position: (32, 24), radius: 5, fill: #FF8000 }\n"
    "    square \"s\" { position: (10, 10), size: 8, border_color: #FFFFFF }\n"
    "}\n"
    "timeline for \"Intro\" {\n"
    "    at 0s to 1s, \"c\".radius -> 20 with ease_out;\n"
    "    at 0s to 1s, \"s\".rotation -> 180;\n"
    "    at 500ms to 1s, \"c\".opacity -> 0.25;\n"
    "}\n";

} // namespace

TEST(compileScript, compilesAllScenes) {
    const CompiledScript script = compileText(
        "scene \"A\" { circle \"c\" {} }\n"
        "scene \"B\" { square \"s\" {} }\n"
    );
    EXPECT_THAT(script.failures, IsEmpty());
    ASSERT_THAT(script.scenes, SizeIs(2));
    EXPECT_EQ("A", script.scenes[0].scene.getName());
    EXPECT_EQ("B", script.scenes[1].scene.getName());
    EXPECT_EQ(1920, script.camera.width);
    EXPECT_EQ(1080, script.camera.height);
}

TEST(compileScript, isolatesSceneFailures) {
    const CompiledScript script = compileText(
        "scene \"Broken\" { hexagon \"h\" {} }\n"
        "scene \"Good\" { circle \"c\" {} }\n"
        "timeline for \"Good\" { at 0s to 1s, \"c\".radius -> 10; }\n"
    );
    ASSERT_THAT(script.scenes, SizeIs(1));
    EXPECT_EQ("Good", script.scenes[0].scene.getName());
    EXPECT_EQ(1_s, script.scenes[0].duration);

    ASSERT_THAT(script.failures, SizeIs(1));
    EXPECT_EQ("Broken", script.failures[0].sceneName);
    EXPECT_THAT(script.failures[0].message, HasSubstr("Error compiling scene \"Broken\"."));
    EXPECT_THAT(script.failures[0].message, HasSubstr("hexagon"));
}

TEST(compileScript, timelineErrorsFailOnlyTheirScene) {
    const CompiledScript script = compileText(
        "scene \"A\" { circle \"c\" {} }\n"
        "scene \"B\" { circle \"c\" {} }\n"
        "timeline for \"A\" { at 0s to 1s, \"ghost\".radius -> 10; }\n"
    );
    ASSERT_THAT(script.scenes, SizeIs(1));
    EXPECT_EQ("B", script.scenes[0].scene.getName());
    ASSERT_THAT(script.failures, SizeIs(1));
    EXPECT_EQ("A", script.failures[0].sceneName);
    EXPECT_THAT(script.failures[0].message, HasSubstr("ghost"));
}

TEST(compileScript, reportsTimelineForUnknownScene) {
    const CompiledScript script = compileText(
        "scene \"A\" { circle \"c\" {} }\n"
        "timeline for \"Missing\" { at 0s to 1s, \"c\".radius -> 10; }\n"
    );
    ASSERT_THAT(script.scenes, SizeIs(1));
    EXPECT_EQ(0_s, script.scenes[0].duration);
    ASSERT_THAT(script.failures, SizeIs(1));
    EXPECT_EQ("Missing", script.failures[0].sceneName);
    EXPECT_THAT(script.failures[0].message, HasSubstr("no scene named \"Missing\""));
}

TEST(compileScript, reportsDuplicateSceneName) {
    const CompiledScript script = compileText(
        "scene \"A\" { circle \"c\" {} }\n"
        "scene \"A\" { square \"s\" {} }\n"
    );
    ASSERT_THAT(script.scenes, SizeIs(1));
    EXPECT_EQ(ShapeKind::Circle, script.scenes[0].scene.getObjects()[0].shapeKind);
    ASSERT_THAT(script.failures, SizeIs(1));
    EXPECT_EQ("A", script.failures[0].sceneName);
}

TEST(compileScript, concatenatesTimelinesOfScene) {
    const CompiledScript script = compileText(
        "scene \"A\" { circle \"c\" {} }\n"
        "timeline for \"A\" { at 0s to 1s, \"c\".radius -> 10; }\n"
        "timeline for \"A\" { at 2s to 3s, \"c\".radius -> 20; }\n"
    );
    ASSERT_THAT(script.scenes, SizeIs(1));
    EXPECT_EQ(3_s, script.scenes[0].duration);
    ASSERT_THAT(script.scenes[0].tracks, SizeIs(1));
    EXPECT_EQ(::Value(20.0), script.scenes[0].tracks[0].resolve(3_s));
}

TEST(compileScript, invalidCameraIsFatal) {
    EXPECT_THROW(
        compileText("camera { width: -5 }\nscene \"A\" { circle \"c\" {} }\n"),
        InvalidPropertyValue
    );
}

TEST(compileScriptFile, reportsParseErrors) {
    const std::filesystem::path filePath =
        std::filesystem::temp_directory_path() / "beam-parse-error-test.beam";
    {
        std::ofstream file(filePath);
        file << "scene \"A\" {\n    circle \"c\" { radius: }\n}\n";
    }

    try {
        compileScriptFile(filePath);
        FAIL() << "Expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_THAT(getMessage(e), HasSubstr("Error parsing script"));
        EXPECT_THAT(getMessage(e), HasSubstr("Line 2"));
    }
    std::filesystem::remove(filePath);
}

TEST(compileScriptFile, reportsMissingFile) {
    EXPECT_THROW(
        compileScriptFile(std::filesystem::temp_directory_path() / "beam-no-such-file.beam"),
        std::runtime_error
    );
}

TEST(renderScene, rendersEveryFrame) {
    const CompiledScript script = compileText(animatedScript);
    ASSERT_THAT(script.scenes, SizeIs(1));

    RenderSettings settings;
    settings.frameRate = 10;
    CollectingFrameSink sink;
    NullProgressSink progressSink;
    renderScene(script.scenes[0], script.camera, settings, sink, progressSink);

    ASSERT_THAT(sink.frames, SizeIs(11));
    EXPECT_EQ(0_s, sink.times[0]);
    EXPECT_EQ(1_s, sink.times[10]);
    EXPECT_THAT(sink.frames[0], SizeIs(64 * 48 * 4));
    EXPECT_NE(sink.frames[0], sink.frames[10]);
}

TEST(renderScene, outputIsIndependentOfThreadCount) {
    const CompiledScript script = compileText(animatedScript);
    ASSERT_THAT(script.scenes, SizeIs(1));

    RenderSettings settings;
    settings.frameRate = 24;
    NullProgressSink progressSink;

    CollectingFrameSink sequentialSink;
    settings.maxThreadCount = 1;
    renderScene(script.scenes[0], script.camera, settings, sequentialSink, progressSink);

    CollectingFrameSink parallelSink;
    settings.maxThreadCount = 4;
    renderScene(script.scenes[0], script.camera, settings, parallelSink, progressSink);

    EXPECT_EQ(sequentialSink.frames, parallelSink.frames);
}

TEST(renderScene, reportsProgress) {
    const CompiledScript script = compileText(animatedScript);
    ASSERT_THAT(script.scenes, SizeIs(1));

    RenderSettings settings;
    settings.frameRate = 4;
    settings.maxThreadCount = 2;
    CollectingFrameSink sink;
    vector<double> progressValues;
    ProgressForwarder progressSink([&](double progress) { progressValues.push_back(progress); });
    renderScene(script.scenes[0], script.camera, settings, sink, progressSink);

    ASSERT_THAT(progressValues, SizeIs(6));
    EXPECT_EQ(0.0, progressValues.front());
    EXPECT_EQ(1.0, progressValues.back());
    EXPECT_TRUE(std::is_sorted(progressValues.begin(), progressValues.end()));
}

TEST(renderScene, propagatesFrameErrors) {
    PropertySet properties;
    properties.set("opacity", ::Value(1.0));
    const CompiledScene compiledScene{
        Scene("S", boost::none, {SceneObject{"c", ShapeKind::Circle, properties, {1, 1}}}),
        {},
        1_s
    };

    RenderSettings settings;
    settings.maxThreadCount = 3;
    CollectingFrameSink sink;
    NullProgressSink progressSink;
    EXPECT_THROW(
        renderScene(compiledScene, Camera(), settings, sink, progressSink), InvariantViolation
    );
    EXPECT_THAT(sink.frames, IsEmpty());
}
