#include "frame-snapshot.h"

FrameSnapshot evaluateSnapshot(const CompiledScene& compiledScene, int index, seconds time) {
    FrameSnapshot snapshot{index, time, {}};
    const auto& objects = compiledScene.scene.getObjects();
    snapshot.objects.reserve(objects.size());
    for (const SceneObject& object : objects) {
        snapshot.objects.push_back({object.id, object.shapeKind, object.properties});
    }

    for (const CompiledTrack& track : compiledScene.tracks) {
        snapshot.objects[track.getObjectIndex()].properties.set(
            track.getPropertyName(), track.resolve(time)
        );
    }
    return snapshot;
}
