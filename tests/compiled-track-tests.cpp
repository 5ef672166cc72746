#include <gmock/gmock.h>

#include "timeline/compiled-track.h"

using namespace testing;
using std::vector;

namespace {

Timed<Transition> segment(
    seconds start, seconds end, double endValue, Easing easing = Easing::Linear
) {
    return Timed<Transition>(start, end, Transition{::Value(endValue), easing});
}

double resolveNumber(const CompiledTrack& track, seconds time) {
    return boost::get<double>(track.resolve(time));
}

} // namespace

TEST(CompiledTrack, withoutSegmentsReturnsBaseValue) {
    const CompiledTrack track(0, "radius", ::Value(7.0), {});
    EXPECT_EQ(7.0, resolveNumber(track, 0_s));
    EXPECT_EQ(7.0, resolveNumber(track, 100_s));
}

TEST(CompiledTrack, beforeFirstSegmentReturnsBaseValue) {
    const CompiledTrack track(0, "radius", ::Value(7.0), {segment(1_s, 2_s, 20.0)});
    EXPECT_EQ(7.0, resolveNumber(track, 0_s));
    EXPECT_EQ(7.0, resolveNumber(track, 999_ms));
    EXPECT_EQ(7.0, resolveNumber(track, 1_s));
}

TEST(CompiledTrack, segmentEndpoints) {
    for (Easing easing : EasingConverter::get().getValues()) {
        const CompiledTrack track(
            0,
            "radius",
            ::Value(0.1),
            {segment(1_s, 3_s, 0.7, easing), segment(4_s, 5_s, 0.3, easing)}
        );
        EXPECT_EQ(0.1, resolveNumber(track, 1_s)) << easing;
        EXPECT_EQ(0.7, resolveNumber(track, 3_s)) << easing;
        EXPECT_EQ(0.7, resolveNumber(track, 4_s)) << easing;
        EXPECT_EQ(0.3, resolveNumber(track, 5_s)) << easing;
    }
}

TEST(CompiledTrack, holdsValueBetweenAndAfterSegments) {
    const CompiledTrack track(
        0, "radius", ::Value(0.0), {segment(0_s, 1_s, 10.0), segment(2_s, 3_s, 30.0)}
    );
    EXPECT_EQ(10.0, resolveNumber(track, 1500_ms));
    EXPECT_DOUBLE_EQ(20.0, resolveNumber(track, 2500_ms));
    EXPECT_EQ(30.0, resolveNumber(track, 3_s));
    EXPECT_EQ(30.0, resolveNumber(track, 60_s));
}

TEST(CompiledTrack, consecutiveSegments) {
    // radius 10 -> 100 over [0s, 1s], then 100 -> 10 over [1s, 2s]
    const CompiledTrack track(
        0, "radius", ::Value(10.0), {segment(0_s, 1_s, 100.0), segment(1_s, 2_s, 10.0)}
    );
    EXPECT_EQ(10.0, resolveNumber(track, 0_s));
    EXPECT_DOUBLE_EQ(55.0, resolveNumber(track, 500_ms));
    EXPECT_EQ(100.0, resolveNumber(track, 1_s));
    EXPECT_DOUBLE_EQ(55.0, resolveNumber(track, 1500_ms));
    EXPECT_EQ(10.0, resolveNumber(track, 2_s));
}

TEST(CompiledTrack, instantSegmentJumps) {
    const CompiledTrack track(0, "radius", ::Value(1.0), {segment(2_s, 2_s, 5.0)});
    EXPECT_EQ(1.0, resolveNumber(track, 1999_ms));
    EXPECT_EQ(5.0, resolveNumber(track, 2_s));
    EXPECT_EQ(5.0, resolveNumber(track, 3_s));
}

TEST(CompiledTrack, instantSegmentAtEndOfRange) {
    const CompiledTrack track(
        0, "radius", ::Value(0.0), {segment(0_s, 1_s, 10.0), segment(1_s, 1_s, 50.0)}
    );
    EXPECT_DOUBLE_EQ(5.0, resolveNumber(track, 500_ms));
    EXPECT_EQ(50.0, resolveNumber(track, 1_s));
}

TEST(CompiledTrack, easedProgress) {
    const CompiledTrack track(
        0,
        "position",
        ::Value(Point(75, 360)),
        {Timed<Transition>(0_s, 2_s, Transition{::Value(Point(1205, 360)), Easing::EaseInOut})}
    );
    EXPECT_EQ(::Value(Point(75, 360)), track.resolve(0_s));
    EXPECT_EQ(::Value(Point(640, 360)), track.resolve(1_s));
    EXPECT_EQ(::Value(Point(1205, 360)), track.resolve(2_s));
    EXPECT_EQ(::Value(Point(1205, 360)), track.resolve(2.5_s));
}

TEST(CompiledTrack, rejectsOverlappingSegments) {
    const vector<Timed<Transition>> overlapping = {segment(0_s, 2_s, 1.0), segment(1_s, 3_s, 2.0)};
    EXPECT_THROW(CompiledTrack(0, "radius", ::Value(0.0), overlapping), std::invalid_argument);

    const vector<Timed<Transition>> unordered = {segment(2_s, 3_s, 1.0), segment(0_s, 1_s, 2.0)};
    EXPECT_THROW(CompiledTrack(0, "radius", ::Value(0.0), unordered), std::invalid_argument);
}

TEST(CompiledTrack, instantBeforeRangeWithSameStart) {
    const CompiledTrack track(
        0, "radius", ::Value(10.0), {segment(1_s, 1_s, 50.0), segment(1_s, 2_s, 100.0)}
    );
    EXPECT_EQ(10.0, resolveNumber(track, 500_ms));
    EXPECT_EQ(50.0, resolveNumber(track, 1_s));
    EXPECT_EQ(75.0, resolveNumber(track, 1.5_s));
    EXPECT_EQ(100.0, resolveNumber(track, 2_s));

    const vector<Timed<Transition>> rangeFirst = {
        segment(1_s, 2_s, 100.0), segment(1_s, 1_s, 50.0)
    };
    EXPECT_THROW(CompiledTrack(0, "radius", ::Value(0.0), rangeFirst), std::invalid_argument);

    const vector<Timed<Transition>> sameInstant = {segment(1_s, 1_s, 1.0), segment(1_s, 1_s, 2.0)};
    EXPECT_THROW(CompiledTrack(0, "radius", ::Value(0.0), sameInstant), std::invalid_argument);
}
