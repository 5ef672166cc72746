#include <gmock/gmock.h>

#include "core/errors.h"
#include "script/script-parser.h"

using namespace testing;
using std::string;

namespace {

int getErrorLine(const string& text) {
    try {
        parseScript(text);
    } catch (const ParseError& e) {
        return e.getLine();
    }
    return 0;
}

} // namespace

TEST(ScriptParser, emptyDocument) {
    const ScriptDocument document = parseScript("  // Nothing here\n\n");
    EXPECT_FALSE(document.camera);
    EXPECT_THAT(document.scenes, IsEmpty());
    EXPECT_THAT(document.timelines, IsEmpty());
}

TEST(ScriptParser, camera) {
    const ScriptDocument document = parseScript(
        "camera {\n"
        "    width: 1280,\n"
        "    height: 720,\n"
        "    background_color: #333333,\n"
        "}\n"
    );
    ASSERT_TRUE(document.camera);
    const auto& properties = document.camera->properties;
    ASSERT_THAT(properties, SizeIs(3));
    EXPECT_EQ("width", properties[0].name);
    EXPECT_EQ(RawValue(1280.0), properties[0].value);
    EXPECT_EQ(2, properties[0].location.line);
    EXPECT_EQ(5, properties[0].location.column);
    EXPECT_EQ("height", properties[1].name);
    EXPECT_EQ(RawValue(720.0), properties[1].value);
    EXPECT_EQ("background_color", properties[2].name);
    EXPECT_EQ(RawValue(HexColorLiteral{"333333"}), properties[2].value);
}

TEST(ScriptParser, scene) {
    const ScriptDocument document = parseScript(
        "scene \"Intro\" {\n"
        "    duration: 3s\n"
        "    circle \"logo\" { radius: 50, fill: #00A0D8, position: (-10.5, 0) }\n"
        "    text \"title\" { content: \"Hello, world\" }\n"
        "    group \"empty\" {}\n"
        "}\n"
    );
    ASSERT_THAT(document.scenes, SizeIs(1));
    const SceneDeclaration& scene = document.scenes[0];
    EXPECT_EQ("Intro", scene.name);
    ASSERT_TRUE(scene.duration);
    EXPECT_EQ(3_s, *scene.duration);
    ASSERT_THAT(scene.objects, SizeIs(3));

    const ObjectDeclaration& logo = scene.objects[0];
    EXPECT_EQ("circle", logo.shape);
    EXPECT_EQ("logo", logo.id);
    EXPECT_EQ(3, logo.location.line);
    ASSERT_THAT(logo.properties, SizeIs(3));
    EXPECT_EQ(RawValue(50.0), logo.properties[0].value);
    EXPECT_EQ(RawValue(HexColorLiteral{"00A0D8"}), logo.properties[1].value);
    EXPECT_EQ(RawValue(TupleLiteral{-10.5, 0}), logo.properties[2].value);

    const ObjectDeclaration& title = scene.objects[1];
    EXPECT_EQ("text", title.shape);
    ASSERT_THAT(title.properties, SizeIs(1));
    EXPECT_EQ(RawValue(string("Hello, world")), title.properties[0].value);

    EXPECT_THAT(scene.objects[2].properties, IsEmpty());
}

TEST(ScriptParser, sceneWithoutDuration) {
    const ScriptDocument document = parseScript("scene \"A\" { square \"s\" { size: 10 } }");
    ASSERT_THAT(document.scenes, SizeIs(1));
    EXPECT_FALSE(document.scenes[0].duration);
}

TEST(ScriptParser, timeline) {
    const ScriptDocument document = parseScript(
        "timeline for \"Intro\" {\n"
        "    at 1s, \"box\".fill -> #FF0000;\n"
        "    at 0s to 1500ms, \"s\".rotation -> 360 with ease_in;\n"
        "    at 2s to 4s, \"my_box\".position -> (1205, 360) with EASE_IN_OUT;\n"
        "}\n"
    );
    ASSERT_THAT(document.timelines, SizeIs(1));
    const TimelineDeclaration& timeline = document.timelines[0];
    EXPECT_EQ("Intro", timeline.sceneName);
    ASSERT_THAT(timeline.animations, SizeIs(3));

    const AnimationDeclaration& instant = timeline.animations[0];
    EXPECT_EQ(1_s, instant.start);
    EXPECT_FALSE(instant.end);
    EXPECT_EQ("box", instant.targetObject);
    EXPECT_EQ("fill", instant.property);
    EXPECT_EQ(RawValue(HexColorLiteral{"FF0000"}), instant.endValue);
    EXPECT_FALSE(instant.easing);
    EXPECT_EQ(2, instant.location.line);

    const AnimationDeclaration& rotation = timeline.animations[1];
    EXPECT_EQ(0_s, rotation.start);
    ASSERT_TRUE(rotation.end);
    EXPECT_EQ(1.5_s, *rotation.end);
    EXPECT_EQ(RawValue(360.0), rotation.endValue);
    ASSERT_TRUE(rotation.easing);
    EXPECT_EQ("ease_in", *rotation.easing);

    const AnimationDeclaration& movement = timeline.animations[2];
    EXPECT_EQ(RawValue(TupleLiteral{1205, 360}), movement.endValue);
    ASSERT_TRUE(movement.easing);
    EXPECT_EQ("EASE_IN_OUT", *movement.easing);
}

TEST(ScriptParser, documentOrder) {
    const ScriptDocument document = parseScript(
        "scene \"A\" {}\n"
        "timeline for \"B\" {}\n"
        "scene \"B\" {}\n"
        "timeline for \"A\" {}\n"
    );
    ASSERT_THAT(document.scenes, SizeIs(2));
    EXPECT_EQ("A", document.scenes[0].name);
    EXPECT_EQ("B", document.scenes[1].name);
    ASSERT_THAT(document.timelines, SizeIs(2));
    EXPECT_EQ("B", document.timelines[0].sceneName);
    EXPECT_EQ("A", document.timelines[1].sceneName);
}

TEST(ScriptParser, reportsErrorLine) {
    EXPECT_EQ(2, getErrorLine("scene \"A\" {\n    circle \"c\" { radius: }\n}"));
    EXPECT_EQ(1, getErrorLine("scene A {}"));
    EXPECT_EQ(3, getErrorLine("camera {}\n\ncamera {}"));
    EXPECT_EQ(2, getErrorLine("timeline for \"A\" {\n    at 1s \"c\".radius -> 5;\n}"));
    EXPECT_EQ(3, getErrorLine("timeline for \"A\" {\n    at 1s, \"c\".radius -> 5\n}"));
}

TEST(ScriptParser, rejectsMalformedValues) {
    // Hex colors need exactly six digits
    EXPECT_THROW(parseScript("camera { background_color: #FFF }"), ParseError);
    EXPECT_THROW(parseScript("camera { background_color: #GGGGGG }"), ParseError);
    // Times need a unit and must be whole numbers
    EXPECT_THROW(parseScript("scene \"A\" { duration: 3 }"), ParseError);
    EXPECT_THROW(parseScript("scene \"A\" { duration: 1.5s }"), ParseError);
    EXPECT_THROW(parseScript("scene \"A\" { duration: 3min }"), ParseError);
    // Property numbers have no unit
    EXPECT_THROW(parseScript("scene \"A\" { circle \"c\" { radius: 5s } }"), ParseError);
    // Unterminated string
    EXPECT_THROW(parseScript("scene \"A {}"), ParseError);
    // Unexpected character
    EXPECT_THROW(parseScript("scene \"A\" { circle \"c\" { radius: 5 } } $"), ParseError);
    // Unknown top-level keyword
    EXPECT_THROW(parseScript("shape \"A\" {}"), ParseError);
}

TEST(ScriptParser, errorMessageContainsPosition) {
    try {
        parseScript("camera {\n  width 5\n}");
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(2, e.getLine());
        EXPECT_EQ(9, e.getColumn());
        EXPECT_THAT(e.what(), HasSubstr("Line 2, column 9"));
    }
}
