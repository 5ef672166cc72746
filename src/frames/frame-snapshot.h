#pragma once

#include <string>
#include <vector>

#include "core/property-set.h"
#include "core/shape-kind.h"
#include "time/seconds.h"
#include "timeline/timeline-compiler.h"

struct ObjectState {
    std::string id;
    ShapeKind shapeKind;
    PropertySet properties;
};

// The resolved state of every object of a scene at one sample time, in draw order
struct FrameSnapshot {
    int index;
    seconds time;
    std::vector<ObjectState> objects;
};

// Overlays the animated property values at the given time onto each object's base properties.
FrameSnapshot evaluateSnapshot(const CompiledScene& compiledScene, int index, seconds time);
