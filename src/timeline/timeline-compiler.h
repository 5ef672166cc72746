#pragma once

#include <vector>

#include "compiled-track.h"
#include "scene/scene.h"
#include "script/parse-tree.h"

struct CompiledScene {
    Scene scene;
    std::vector<CompiledTrack> tracks;
    // The declared duration, or the end of the last animation if none was declared
    seconds duration;
};

// Resolves the animations of a scene into one track per animated (object, property) pair.
// Throws a ReferenceError, TimingError or EasingError describing the first problem found.
CompiledScene compileTimeline(Scene scene, const std::vector<AnimationDeclaration>& animations);
