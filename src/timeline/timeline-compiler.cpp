#include "timeline-compiler.h"

#include <fmt/format.h>

#include <algorithm>
#include <map>
#include <utility>

#include "core/errors.h"
#include "logging/logging.h"

using boost::optional;
using std::map;
using std::pair;
using std::string;
using std::vector;

namespace {

struct TrackEntry {
    Timed<Transition> segment;
    SourceLocation location;
};

string describeAnimation(const Scene& scene, const AnimationDeclaration& animation) {
    return fmt::format(
        "animation of \"{}\".{} in scene \"{}\", line {}",
        animation.targetObject,
        animation.property,
        scene.getName(),
        animation.location.line
    );
}

Easing resolveEasing(const optional<string>& name, const string& context) {
    if (!name) return Easing::Linear;

    const optional<Easing> easing = EasingConverter::get().tryParse(*name);
    if (!easing) {
        throw UnknownEasing(*name, context);
    }
    return *easing;
}

} // namespace

CompiledScene compileTimeline(Scene scene, const vector<AnimationDeclaration>& animations) {
    using TrackKey = pair<size_t, string>;
    map<TrackKey, vector<TrackEntry>> entriesByTrack;

    for (const AnimationDeclaration& animation : animations) {
        const string context = describeAnimation(scene, animation);

        const seconds start = animation.start;
        const seconds end = animation.end.value_or(start);
        if (end < start) {
            throw InvalidTimeRange(start, end, context);
        }

        const optional<size_t> objectIndex = scene.findObjectIndex(animation.targetObject);
        if (!objectIndex) {
            throw UnknownObjectReference(animation.targetObject, context);
        }
        const SceneObject& object = scene.getObjects()[*objectIndex];

        const optional<const Value&> baseValue = object.properties.tryGet(animation.property);
        if (!baseValue) {
            throw UnknownPropertyReference(
                object.id,
                animation.property,
                fmt::format(
                    "{} \"{}\" has no such property value.",
                    ShapeKindConverter::get().toString(object.shapeKind),
                    object.id
                ),
                context
            );
        }
        const ValueType expectedType = getValueType(*baseValue);
        const RawValueKind actualKind = getRawValueKind(animation.endValue);
        if (toValueType(actualKind) != expectedType) {
            throw UnknownPropertyReference(
                object.id,
                animation.property,
                fmt::format(
                    "expected a {} target value, but got a {}.",
                    ValueTypeConverter::get().toString(expectedType),
                    RawValueKindConverter::get().toString(actualKind)
                ),
                context
            );
        }

        const Easing easing = resolveEasing(animation.easing, context);
        entriesByTrack[{*objectIndex, animation.property}].push_back({
            Timed<Transition>(start, end, Transition{toValue(animation.endValue), easing}),
            animation.location
        });
    }

    vector<CompiledTrack> tracks;
    seconds latestEnd = seconds::zero();
    for (auto& trackEntries : entriesByTrack) {
        const size_t objectIndex = trackEntries.first.first;
        const string& propertyName = trackEntries.first.second;
        vector<TrackEntry>& entries = trackEntries.second;

        const auto byTime = [](const TrackEntry& a, const TrackEntry& b) {
            return a.segment.getTimeRange() < b.segment.getTimeRange();
        };
        std::stable_sort(entries.begin(), entries.end(), byTime);

        const SceneObject& object = scene.getObjects()[objectIndex];
        for (size_t i = 1; i < entries.size(); ++i) {
            const TrackEntry& previous = entries[i - 1];
            const TrackEntry& current = entries[i];
            if (current.segment.getTimeRange().conflictsWith(previous.segment.getTimeRange())) {
                throw OverlappingAnimation(
                    object.id,
                    propertyName,
                    previous.segment.getTimeRange(),
                    current.segment.getTimeRange(),
                    fmt::format(
                        "scene \"{}\", lines {} and {}",
                        scene.getName(),
                        previous.location.line,
                        current.location.line
                    )
                );
            }
        }

        vector<Timed<Transition>> segments;
        for (const TrackEntry& entry : entries) {
            segments.push_back(entry.segment);
            latestEnd = std::max(latestEnd, entry.segment.getEnd());
        }
        tracks.emplace_back(
            objectIndex, propertyName, object.properties.get(propertyName), std::move(segments)
        );
    }

    seconds duration = latestEnd;
    if (const optional<seconds> declaredDuration = scene.getDeclaredDuration()) {
        duration = *declaredDuration;
        if (latestEnd > duration) {
            logging::warnFormat(
                "Scene \"{}\" has animations ending at {}, after its declared duration of {}. "
                "Their remainder will not be rendered.",
                scene.getName(),
                formatDuration(latestEnd),
                formatDuration(duration)
            );
        }
    }

    logging::debugFormat(
        "Compiled {} animations of scene \"{}\" into {} tracks. Duration: {}.",
        animations.size(),
        scene.getName(),
        tracks.size(),
        formatDuration(duration)
    );
    return CompiledScene{std::move(scene), std::move(tracks), duration};
}
