#pragma once

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <ostream>
#include <string>
#include <vector>

#include "core/source-location.h"
#include "core/value.h"
#include "time/seconds.h"

struct TupleLiteral {
    double first;
    double second;

    bool operator==(const TupleLiteral& rhs) const {
        return first == rhs.first && second == rhs.second;
    }
};

struct HexColorLiteral {
    // Six hex digits, without the leading '#'
    std::string digits;

    bool operator==(const HexColorLiteral& rhs) const {
        return digits == rhs.digits;
    }
};

std::ostream& operator<<(std::ostream& stream, const TupleLiteral& tuple);
std::ostream& operator<<(std::ostream& stream, const HexColorLiteral& hexColor);

// A value as written in the script. The order of alternatives matches RawValueKind.
using RawValue = boost::variant<double, TupleLiteral, HexColorLiteral, std::string>;

enum class RawValueKind { Number, Tuple, HexColor, String };

class RawValueKindConverter : public EnumConverter<RawValueKind> {
public:
    static RawValueKindConverter& get();

protected:
    std::string getTypeName() override;
    member_data getMemberData() override;
};

std::ostream& operator<<(std::ostream& stream, RawValueKind value);

RawValueKind getRawValueKind(const RawValue& value);

// The value type each syntactic kind denotes
ValueType toValueType(RawValueKind kind);

Value toValue(const RawValue& rawValue);

struct PropertyDeclaration {
    std::string name;
    RawValue value;
    SourceLocation location;
};

struct ObjectDeclaration {
    std::string shape;
    std::string id;
    std::vector<PropertyDeclaration> properties;
    SourceLocation location;
};

struct SceneDeclaration {
    std::string name;
    boost::optional<seconds> duration;
    std::vector<ObjectDeclaration> objects;
    SourceLocation location;
};

struct AnimationDeclaration {
    seconds start;
    // Absent for instant changes
    boost::optional<seconds> end;
    std::string targetObject;
    std::string property;
    RawValue endValue;
    boost::optional<std::string> easing;
    SourceLocation location;
};

struct TimelineDeclaration {
    std::string sceneName;
    std::vector<AnimationDeclaration> animations;
    SourceLocation location;
};

struct CameraDeclaration {
    std::vector<PropertyDeclaration> properties;
    SourceLocation location;
};

struct ScriptDocument {
    boost::optional<CameraDeclaration> camera;
    std::vector<SceneDeclaration> scenes;
    std::vector<TimelineDeclaration> timelines;
};
