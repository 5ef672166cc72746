#include "errors.h"

#include <fmt/format.h>

using std::string;

namespace {

string withContext(const string& message, const string& context) {
    return context.empty() ? message : fmt::format("{} ({})", message, context);
}

} // namespace

ScriptError::ScriptError(const string& message, const string& context) :
    std::runtime_error(withContext(message, context)),
    context(context) {}

UnknownShape::UnknownShape(const string& shape, const string& context) :
    SchemaError(fmt::format("Unknown shape '{}'.", shape), context),
    shape(shape) {}

UnknownProperty::UnknownProperty(
    const string& shape, const string& property, const string& context
) :
    SchemaError(fmt::format("Unknown property '{}' for shape {}.", property, shape), context),
    property(property) {}

SchemaTypeMismatch::SchemaTypeMismatch(
    const string& shape,
    const string& property,
    ValueType expected,
    const string& actual,
    const string& context
) :
    SchemaError(
        fmt::format(
            "Property '{}' of shape {} expects a {} value, but got a {}.",
            property,
            shape,
            ValueTypeConverter::get().toString(expected),
            actual
        ),
        context
    ),
    property(property),
    expected(expected) {}

DuplicateProperty::DuplicateProperty(const string& property, const string& context) :
    SchemaError(fmt::format("Property '{}' is declared more than once.", property), context) {}

DuplicateObjectId::DuplicateObjectId(const string& id, const string& context) :
    SchemaError(fmt::format("Object id \"{}\" is used more than once.", id), context),
    id(id) {}

DuplicateSceneName::DuplicateSceneName(const string& name, const string& context) :
    SchemaError(fmt::format("Scene name \"{}\" is used more than once.", name), context) {}

InvalidPropertyValue::InvalidPropertyValue(
    const string& property, const string& problem, const string& context
) :
    SchemaError(fmt::format("Invalid value for property '{}': {}", property, problem), context) {}

UnknownSceneReference::UnknownSceneReference(const string& sceneName, const string& context) :
    ReferenceError(fmt::format("There is no scene named \"{}\".", sceneName), context),
    sceneName(sceneName) {}

UnknownObjectReference::UnknownObjectReference(const string& objectId, const string& context) :
    ReferenceError(fmt::format("There is no object \"{}\".", objectId), context),
    objectId(objectId) {}

UnknownPropertyReference::UnknownPropertyReference(
    const string& objectId, const string& property, const string& problem, const string& context
) :
    ReferenceError(
        fmt::format(
            "Cannot animate property '{}' of object \"{}\": {}", property, objectId, problem
        ),
        context
    ),
    property(property) {}

OverlappingAnimation::OverlappingAnimation(
    const string& objectId,
    const string& property,
    const TimeRange& first,
    const TimeRange& second,
    const string& context
) :
    TimingError(
        fmt::format(
            "Animations of \"{}\".{} overlap: [{}, {}] and [{}, {}].",
            objectId,
            property,
            formatDuration(first.getStart()),
            formatDuration(first.getEnd()),
            formatDuration(second.getStart()),
            formatDuration(second.getEnd())
        ),
        context
    ),
    first(first),
    second(second) {}

InvalidTimeRange::InvalidTimeRange(seconds start, seconds end, const string& context) :
    TimingError(
        fmt::format(
            "Animation ends at {} before it starts at {}.",
            formatDuration(end),
            formatDuration(start)
        ),
        context
    ) {}

NonPositiveDuration::NonPositiveDuration(seconds duration, const string& context) :
    TimingError(
        fmt::format("Scene duration must be positive, but is {}.", formatDuration(duration)),
        context
    ) {}

UnknownEasing::UnknownEasing(const string& name, const string& context) :
    EasingError(fmt::format("Unknown easing '{}'.", name), context),
    name(name) {}

ParseError::ParseError(int line, int column, const string& message) :
    std::runtime_error(fmt::format("Line {}, column {}: {}", line, column, message)),
    line(line),
    column(column) {}
