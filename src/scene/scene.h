#pragma once

#include <boost/optional.hpp>
#include <string>
#include <vector>

#include "core/property-set.h"
#include "core/shape-kind.h"
#include "core/source-location.h"
#include "time/seconds.h"

struct SceneObject {
    std::string id;
    ShapeKind shapeKind;
    // Declared properties plus schema defaults
    PropertySet properties;
    SourceLocation location;
};

// A validated scene. Objects are kept in declaration order, which is also the draw order.
class Scene {
public:
    Scene(
        std::string name,
        boost::optional<seconds> declaredDuration,
        std::vector<SceneObject> objects
    );

    const std::string& getName() const {
        return name;
    }

    boost::optional<seconds> getDeclaredDuration() const {
        return declaredDuration;
    }

    const std::vector<SceneObject>& getObjects() const {
        return objects;
    }

    boost::optional<size_t> findObjectIndex(const std::string& id) const;

private:
    std::string name;
    boost::optional<seconds> declaredDuration;
    std::vector<SceneObject> objects;
};
