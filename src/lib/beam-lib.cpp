#include "beam-lib.h"

#include <fmt/format.h>

#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

#include "core/errors.h"
#include "frames/frame-schedule.h"
#include "frames/frame-snapshot.h"
#include "logging/logging.h"
#include "rendering/renderer.h"
#include "scene/scene-builder.h"
#include "script/script-parser.h"
#include "tools/exceptions.h"
#include "tools/parallel.h"
#include "tools/text-files.h"

using std::map;
using std::set;
using std::string;
using std::vector;
using std::filesystem::path;

namespace {

CompiledScene compileScene(
    const SceneDeclaration& declaration, const vector<AnimationDeclaration>& animations
) {
    try {
        return compileTimeline(buildScene(declaration), animations);
    } catch (const ScriptError&) {
        std::throw_with_nested(std::runtime_error(
            fmt::format("Error compiling scene \"{}\".", declaration.name)
        ));
    }
}

void recordFailure(CompiledScript& script, const string& sceneName, const std::exception& e) {
    const string message = getMessage(e);
    logging::error(message);
    script.failures.push_back({sceneName, message});
}

} // namespace

CompiledScript compileScript(const ScriptDocument& document) {
    CompiledScript script;
    script.camera = buildCamera(document.camera);

    set<string> sceneNames;
    for (const SceneDeclaration& scene : document.scenes) {
        sceneNames.insert(scene.name);
    }

    // Timelines for the same scene are concatenated in document order
    map<string, vector<AnimationDeclaration>> animationsByScene;
    for (const TimelineDeclaration& timeline : document.timelines) {
        if (sceneNames.find(timeline.sceneName) == sceneNames.end()) {
            recordFailure(
                script,
                timeline.sceneName,
                UnknownSceneReference(
                    timeline.sceneName, fmt::format("timeline, line {}", timeline.location.line)
                )
            );
            continue;
        }
        auto& animations = animationsByScene[timeline.sceneName];
        animations.insert(animations.end(), timeline.animations.begin(), timeline.animations.end());
    }

    set<string> compiledSceneNames;
    for (const SceneDeclaration& scene : document.scenes) {
        if (!compiledSceneNames.insert(scene.name).second) {
            recordFailure(
                script,
                scene.name,
                DuplicateSceneName(scene.name, fmt::format("line {}", scene.location.line))
            );
            continue;
        }

        try {
            script.scenes.push_back(compileScene(scene, animationsByScene[scene.name]));
        } catch (const std::runtime_error& e) {
            recordFailure(script, scene.name, e);
        }
    }

    logging::infoFormat("Compiled {} of {} scenes.", script.scenes.size(), document.scenes.size());
    return script;
}

CompiledScript compileScriptFile(const path& filePath) {
    const string text = readUtf8File(filePath);
    try {
        return compileScript(parseScript(text));
    } catch (const ParseError&) {
        std::throw_with_nested(
            std::runtime_error(fmt::format("Error parsing script {}.", filePath.u8string()))
        );
    }
}

void renderScene(
    const CompiledScene& compiledScene,
    const Camera& camera,
    const RenderSettings& settings,
    FrameSink& frameSink,
    ProgressSink& progressSink
) {
    const FrameSchedule schedule(compiledScene.duration, settings.frameRate);
    const int frameCount = schedule.getFrameCount();
    logging::infoFormat(
        "Rendering scene \"{}\": {} frames at {:g} fps.",
        compiledScene.scene.getName(),
        frameCount,
        settings.frameRate
    );

    std::mutex progressMutex;
    int finishedFrameCount = 0;
    progressSink.reportProgress(0.0);

    runParallel(
        [&](int frameIndex) {
            const seconds time = schedule.getFrameTime(frameIndex);
            const FrameSnapshot snapshot = evaluateSnapshot(compiledScene, frameIndex, time);
            PixelBuffer pixels = renderSnapshot(snapshot, camera, settings.glyphRasterizer);
            frameSink.receiveFrame(RenderedFrame(frameIndex, time, std::move(pixels)));

            std::lock_guard<std::mutex> lock(progressMutex);
            ++finishedFrameCount;
            progressSink.reportProgress(static_cast<double>(finishedFrameCount) / frameCount);
        },
        schedule.getFrameIndices(),
        settings.maxThreadCount
    );

    logging::debugFormat("Finished rendering scene \"{}\".", compiledScene.scene.getName());
}
