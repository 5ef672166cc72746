#pragma once

#include <stdexcept>
#include <string>

#include "time/time-range.h"
#include "value.h"

// Base class for all diagnostics caused by the content of a script.
// The context names where the problem is, e.g. `object "box" in scene "Intro", line 3`.
class ScriptError : public std::runtime_error {
public:
    ScriptError(const std::string& message, const std::string& context);

    const std::string& getContext() const {
        return context;
    }

private:
    std::string context;
};

class SchemaError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

class ReferenceError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

class TimingError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

class EasingError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

class UnknownShape : public SchemaError {
public:
    UnknownShape(const std::string& shape, const std::string& context);

    const std::string& getShape() const {
        return shape;
    }

private:
    std::string shape;
};

class UnknownProperty : public SchemaError {
public:
    UnknownProperty(
        const std::string& shape, const std::string& property, const std::string& context
    );

    const std::string& getProperty() const {
        return property;
    }

private:
    std::string property;
};

class SchemaTypeMismatch : public SchemaError {
public:
    SchemaTypeMismatch(
        const std::string& shape,
        const std::string& property,
        ValueType expected,
        const std::string& actual,
        const std::string& context
    );

    const std::string& getProperty() const {
        return property;
    }
    ValueType getExpected() const {
        return expected;
    }

private:
    std::string property;
    ValueType expected;
};

class DuplicateProperty : public SchemaError {
public:
    DuplicateProperty(const std::string& property, const std::string& context);
};

class DuplicateObjectId : public SchemaError {
public:
    DuplicateObjectId(const std::string& id, const std::string& context);

    const std::string& getId() const {
        return id;
    }

private:
    std::string id;
};

class DuplicateSceneName : public SchemaError {
public:
    DuplicateSceneName(const std::string& name, const std::string& context);
};

class InvalidPropertyValue : public SchemaError {
public:
    InvalidPropertyValue(
        const std::string& property, const std::string& problem, const std::string& context
    );
};

class UnknownSceneReference : public ReferenceError {
public:
    UnknownSceneReference(const std::string& sceneName, const std::string& context);

    const std::string& getSceneName() const {
        return sceneName;
    }

private:
    std::string sceneName;
};

class UnknownObjectReference : public ReferenceError {
public:
    UnknownObjectReference(const std::string& objectId, const std::string& context);

    const std::string& getObjectId() const {
        return objectId;
    }

private:
    std::string objectId;
};

class UnknownPropertyReference : public ReferenceError {
public:
    UnknownPropertyReference(
        const std::string& objectId,
        const std::string& property,
        const std::string& problem,
        const std::string& context
    );

    const std::string& getProperty() const {
        return property;
    }

private:
    std::string property;
};

class OverlappingAnimation : public TimingError {
public:
    OverlappingAnimation(
        const std::string& objectId,
        const std::string& property,
        const TimeRange& first,
        const TimeRange& second,
        const std::string& context
    );

    const TimeRange& getFirst() const {
        return first;
    }
    const TimeRange& getSecond() const {
        return second;
    }

private:
    TimeRange first;
    TimeRange second;
};

class InvalidTimeRange : public TimingError {
public:
    InvalidTimeRange(seconds start, seconds end, const std::string& context);
};

class NonPositiveDuration : public TimingError {
public:
    NonPositiveDuration(seconds duration, const std::string& context);
};

class UnknownEasing : public EasingError {
public:
    UnknownEasing(const std::string& name, const std::string& context);

    const std::string& getName() const {
        return name;
    }

private:
    std::string name;
};

class ParseError : public std::runtime_error {
public:
    ParseError(int line, int column, const std::string& message);

    int getLine() const {
        return line;
    }
    int getColumn() const {
        return column;
    }

private:
    int line;
    int column;
};

// Broken internal invariant, e.g. a property of the wrong type reaching the renderer
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};
