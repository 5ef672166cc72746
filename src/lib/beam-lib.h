#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/camera.h"
#include "exporters/frame-sink.h"
#include "rendering/glyph-rasterizer.h"
#include "script/parse-tree.h"
#include "timeline/timeline-compiler.h"
#include "tools/progress.h"

struct SceneFailure {
    std::string sceneName;
    std::string message;
};

struct CompiledScript {
    Camera camera;
    // In document order
    std::vector<CompiledScene> scenes;
    std::vector<SceneFailure> failures;
};

// Compiles each scene of the document independently. A scene with errors is left out and
// recorded as a failure; the other scenes are unaffected. Throws if the camera is invalid.
CompiledScript compileScript(const ScriptDocument& document);

// Reads, parses and compiles a script file. Throws if the file can't be read or parsed.
CompiledScript compileScriptFile(const std::filesystem::path& filePath);

struct RenderSettings {
    double frameRate = 30;
    int maxThreadCount = 1;
    // Optional; without it, text objects are not drawn
    const GlyphRasterizer* glyphRasterizer = nullptr;
};

// Renders every frame of the scene and passes it to the frame sink. Frames are rendered on up to
// maxThreadCount threads and may arrive in any order. If a frame fails, no further frames are
// started and the error is rethrown.
void renderScene(
    const CompiledScene& compiledScene,
    const Camera& camera,
    const RenderSettings& settings,
    FrameSink& frameSink,
    ProgressSink& progressSink
);
