#include <fmt/format.h>
#include <tclap/CmdLine.h>

#include <boost/algorithm/string/join.hpp>
#include <boost/range/adaptor/transformed.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "app-info.h"
#include "exporters/pam-frame-exporter.h"
#include "frames/frame-schedule.h"
#include "lib/beam-lib.h"
#include "logging/formatters.h"
#include "logging/logging.h"
#include "logging/sinks.h"
#include "rendering/freetype-glyph-rasterizer.h"
#include "semantic-entries.h"
#include "sinks/nice-stderr-sink.h"
#include "sinks/quiet-stderr-sink.h"
#include "tools/exceptions.h"
#include "tools/parallel.h"

using boost::adaptors::transformed;
using std::exception;
using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;
using std::filesystem::path;
using std::filesystem::u8path;

namespace tclap = TCLAP;

// Tell TCLAP how to handle our types
namespace TCLAP {
template <>
struct ArgTraits<logging::Level> {
    typedef ValueLike ValueCategory;
};
} // namespace TCLAP

shared_ptr<logging::Sink> createFileSink(const path& path, logging::Level minLevel) {
    auto file = make_shared<std::ofstream>();
    file->exceptions(std::ifstream::failbit | std::ifstream::badbit);
    file->open(path);
    auto fileSink =
        make_shared<logging::StreamSink>(file, make_shared<logging::SimpleFileFormatter>());
    return make_shared<logging::LevelFilter>(fileSink, minLevel);
}

unique_ptr<GlyphRasterizer> createGlyphRasterizer(const tclap::ValueArg<string>& fontFile) {
    if (!fontFile.isSet()) return nullptr;
    return make_unique<FreeTypeGlyphRasterizer>(u8path(fontFile.getValue()));
}

bool containsText(const CompiledScript& script) {
    for (const CompiledScene& compiledScene : script.scenes) {
        for (const SceneObject& object : compiledScene.scene.getObjects()) {
            if (object.shapeKind == ShapeKind::Text) return true;
        }
    }
    return false;
}

int main(int argc, char* argv[]) {
    // Set up default logging so early errors are printed to stderr
    const logging::Level defaultMinStderrLevel = logging::Level::Error;
    shared_ptr<logging::Sink> defaultSink = make_shared<NiceStderrSink>(defaultMinStderrLevel);
    logging::addSink(defaultSink);

    const vector<string> args(argv, argv + argc);

    // Define command-line parameters
    const char argumentValueSeparator = ' ';
    tclap::CmdLine cmd(appName, argumentValueSeparator, appVersion);
    cmd.setExceptionHandling(false);

    tclap::ValueArg<string> outputDirectory(
        "o", "output", "The directory for the frame files. Defaults to <input name>_frames.",
        false, string(), "string", cmd
    );

    auto logLevels = vector<logging::Level>(logging::LevelConverter::get().getValues());
    tclap::ValuesConstraint<logging::Level> logLevelConstraint(logLevels);
    tclap::ValueArg<logging::Level> logLevel(
        "", "logLevel", "The minimum log level that will be written to the log file",
        false, logging::Level::Debug, &logLevelConstraint, cmd
    );

    tclap::ValueArg<string> logFileName(
        "", "logFile", "The log file path.",
        false, string(), "string", cmd
    );
    tclap::ValueArg<logging::Level> consoleLevel(
        "", "consoleLevel", "The minimum log level that will be printed on the console (stderr)",
        false, defaultMinStderrLevel, &logLevelConstraint, cmd
    );

    tclap::SwitchArg quietMode(
        "q", "quiet", "Suppresses all output to stderr except for warnings and error messages.",
        cmd, false
    );

    tclap::ValueArg<int> maxThreadCount(
        "", "threads", "The maximum number of worker threads to use.",
        false, getProcessorCoreCount(), "number", cmd
    );

    tclap::ValueArg<double> frameRate(
        "", "frameRate", "The number of frames per second.",
        false, 30.0, "number", cmd
    );

    tclap::ValueArg<string> fontFile(
        "", "font", "A TrueType or OpenType font file for text objects.",
        false, string(), "string", cmd
    );

    tclap::UnlabeledValueArg<string> inputFileName(
        "inputFile", "The animation script (.beam).",
        true, "", "string", cmd
    );

    try {
        // Parse command line
        {
            // TCLAP mutates the function argument! Pass a copy.
            vector<string> argsCopy(args);
            cmd.parse(argsCopy);
        }

        // Set up logging
        // ... to stderr
        if (quietMode.getValue()) {
            logging::addSink(make_shared<QuietStderrSink>(consoleLevel.getValue()));
        } else {
            logging::addSink(make_shared<NiceStderrSink>(consoleLevel.getValue()));
        }
        logging::removeSink(defaultSink);
        // ... to log file
        if (logFileName.isSet()) {
            auto fileSink = createFileSink(u8path(logFileName.getValue()), logLevel.getValue());
            logging::addSink(fileSink);
        }

        // Validate and transform command line arguments
        if (maxThreadCount.getValue() < 1) {
            throw std::runtime_error("Thread count must be 1 or higher.");
        }
        if (!(frameRate.getValue() > 0)) {
            throw std::runtime_error("Frame rate must be positive.");
        }
        const path inputFilePath = u8path(inputFileName.getValue());
        const path outputPath = outputDirectory.isSet()
            ? u8path(outputDirectory.getValue())
            : path(inputFilePath.stem().u8string() + "_frames");

        logging::log(StartEntry(inputFilePath));
        logging::debugFormat(
            "Command line: {}",
            boost::algorithm::join(
                args | transformed([](string arg) { return fmt::format("\"{}\"", arg); }), " "
            )
        );

        try {
            const CompiledScript script = compileScriptFile(inputFilePath);

            const unique_ptr<GlyphRasterizer> glyphRasterizer = createGlyphRasterizer(fontFile);
            if (!glyphRasterizer && containsText(script)) {
                logging::warn("No font given (--font). Text objects will not be drawn.");
            }

            RenderSettings settings;
            settings.frameRate = frameRate.getValue();
            settings.maxThreadCount = maxThreadCount.getValue();
            settings.glyphRasterizer = glyphRasterizer.get();

            // Frame numbers continue across scenes
            int frameOffset = 0;
            for (const CompiledScene& compiledScene : script.scenes) {
                const int frameCount =
                    FrameSchedule(compiledScene.duration, settings.frameRate).getFrameCount();
                logging::log(SceneStartEntry(compiledScene.scene.getName(), frameCount));

                // On progress change: Create log message
                ProgressForwarder progressSink([](double progress) {
                    logging::log(ProgressEntry(progress));
                });
                PamFrameExporter exporter(outputPath, frameOffset);
                renderScene(compiledScene, script.camera, settings, exporter, progressSink);
                frameOffset += frameCount;
            }

            if (!script.failures.empty()) {
                throw std::runtime_error(fmt::format(
                    "{} errors in script. Only {} scenes were rendered.",
                    script.failures.size(),
                    script.scenes.size()
                ));
            }
            logging::log(SuccessEntry(frameOffset));
        } catch (const exception&) {
            std::throw_with_nested(std::runtime_error(
                fmt::format("Error processing file {}.", inputFilePath.u8string())
            ));
        }

        return 0;
    } catch (tclap::ArgException& e) {
        // Error parsing command-line args.
        logging::log(FailureEntry(
            fmt::format("Invalid command line: {} Run `beam --help` for usage.", e.error())
        ));
        return 1;
    } catch (tclap::ExitException&) {
        // A built-in TCLAP command (like --help) has finished. Exit application.
        logging::info("Exiting application after help-like command.");
        return 0;
    } catch (const exception& e) {
        // Generic error
        const string message = getMessage(e);
        logging::log(FailureEntry(message));
        return 1;
    }
}
