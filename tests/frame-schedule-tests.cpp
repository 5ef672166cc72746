#include <gmock/gmock.h>

#include <limits>
#include <vector>

#include "frames/frame-schedule.h"
#include "frames/frame-snapshot.h"
#include "scene/scene-builder.h"
#include "script/script-parser.h"

using namespace testing;
using std::vector;

TEST(FrameSchedule, frameCount) {
    EXPECT_EQ(1, FrameSchedule(0_s, 30).getFrameCount());
    EXPECT_EQ(31, FrameSchedule(1_s, 30).getFrameCount());
    EXPECT_EQ(91, FrameSchedule(3_s, 30).getFrameCount());
    EXPECT_EQ(61, FrameSchedule(2_s, 30).getFrameCount());
    EXPECT_EQ(4, FrameSchedule(100_ms, 24).getFrameCount());
}

TEST(FrameSchedule, frameTimes) {
    const FrameSchedule schedule(1_s, 4);
    EXPECT_EQ(5, schedule.getFrameCount());
    EXPECT_EQ(0_s, schedule.getFrameTime(0));
    EXPECT_EQ(250_ms, schedule.getFrameTime(1));
    EXPECT_EQ(1_s, schedule.getFrameTime(4));
}

TEST(FrameSchedule, lastFrameIsClampedToDuration) {
    const FrameSchedule schedule(1050_ms, 10);
    ASSERT_EQ(12, schedule.getFrameCount());
    EXPECT_DOUBLE_EQ(1.0, schedule.getFrameTime(10).count());
    EXPECT_EQ(1050_ms, schedule.getFrameTime(11));
}

TEST(FrameSchedule, sampleTimes) {
    const FrameSchedule schedule(1_s, 2);
    vector<seconds> times;
    for (seconds time : schedule.getSampleTimes()) {
        times.push_back(time);
    }
    EXPECT_THAT(times, ElementsAre(0_s, 500_ms, 1_s));

    // Iterating again yields the same times
    vector<seconds> secondPass;
    for (seconds time : schedule.getSampleTimes()) {
        secondPass.push_back(time);
    }
    EXPECT_EQ(times, secondPass);
}

TEST(FrameSchedule, frameIndices) {
    vector<int> indices;
    for (int index : FrameSchedule(1_s, 3).getFrameIndices()) {
        indices.push_back(index);
    }
    EXPECT_THAT(indices, ElementsAre(0, 1, 2, 3));
}

TEST(FrameSchedule, rejectsInvalidArguments) {
    EXPECT_THROW(FrameSchedule(1_s, 0), std::invalid_argument);
    EXPECT_THROW(FrameSchedule(1_s, -30), std::invalid_argument);
    EXPECT_THROW(
        FrameSchedule(1_s, std::numeric_limits<double>::quiet_NaN()), std::invalid_argument
    );
    EXPECT_THROW(
        FrameSchedule(1_s, std::numeric_limits<double>::infinity()), std::invalid_argument
    );
    EXPECT_THROW(FrameSchedule(seconds(-1), 30), std::invalid_argument);
}

TEST(FrameSchedule, rejectsOutOfRangeFrames) {
    const FrameSchedule schedule(1_s, 2);
    EXPECT_THROW(schedule.getFrameTime(-1), std::out_of_range);
    EXPECT_THROW(schedule.getFrameTime(3), std::out_of_range);
}

TEST(FrameSnapshot, overlaysAnimatedValues) {
    const ScriptDocument document = parseScript(
        "scene \"S\" {\n"
        "    circle \"a\" { radius: 10 }\n"
        "    circle \"b\" { radius: 20 }\n"
        "}\n"
        "timeline for \"S\" {\n"
        "    at 0s to 1s, \"b\".radius -> 40;\n"
        "}"
    );
    const CompiledScene compiled =
        compileTimeline(buildScene(document.scenes.at(0)), document.timelines.at(0).animations);

    const FrameSnapshot snapshot = evaluateSnapshot(compiled, 7, 500_ms);
    EXPECT_EQ(7, snapshot.index);
    EXPECT_EQ(500_ms, snapshot.time);
    ASSERT_THAT(snapshot.objects, SizeIs(2));
    EXPECT_EQ("a", snapshot.objects[0].id);
    EXPECT_EQ(10, snapshot.objects[0].properties.getNumber("radius"));
    EXPECT_EQ("b", snapshot.objects[1].id);
    EXPECT_EQ(30, snapshot.objects[1].properties.getNumber("radius"));
    EXPECT_EQ(ShapeKind::Circle, snapshot.objects[1].shapeKind);

    // Evaluation does not alter the compiled scene
    EXPECT_EQ(20, compiled.scene.getObjects()[1].properties.getNumber("radius"));
}
