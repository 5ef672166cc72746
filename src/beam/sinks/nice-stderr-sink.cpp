#include "nice-stderr-sink.h"

#include <fmt/format.h>

#include <boost/utility/in_place_factory.hpp>
#include <iostream>

#include "beam/semantic-entries.h"
#include "logging/formatters.h"
#include "logging/sinks.h"

using logging::Level;
using logging::SimpleConsoleFormatter;
using logging::StdErrSink;
using std::make_shared;

NiceStderrSink::NiceStderrSink(Level minLevel) :
    minLevel(minLevel),
    progress(0.0),
    innerSink(make_shared<StdErrSink>(make_shared<SimpleConsoleFormatter>())) {}

void NiceStderrSink::receive(const logging::Entry& entry) {
    // For selected semantic entries, print a user-friendly message instead of the technical log
    // message.
    if (const auto* startEntry = dynamic_cast<const StartEntry*>(&entry)) {
        std::cerr << fmt::format(
            "Rendering frames for {}.", startEntry->getInputFilePath().u8string()
        ) << std::endl;
    } else if (const auto* sceneStartEntry = dynamic_cast<const SceneStartEntry*>(&entry)) {
        if (progressBar) interruptProgressIndication();
        std::cerr << fmt::format("Scene \"{}\": ", sceneStartEntry->getSceneName());
        startProgressIndication();
    } else if (const auto* progressEntry = dynamic_cast<const ProgressEntry*>(&entry)) {
        progress = progressEntry->getProgress();
        if (progressBar) progressBar->reportProgress(progress);
    } else if (const auto* successEntry = dynamic_cast<const SuccessEntry*>(&entry)) {
        if (progressBar) interruptProgressIndication();
        std::cerr << fmt::format("Done. Wrote {} frames.", successEntry->getFrameCount())
                  << std::endl;
    } else if (entry.level >= minLevel) {
        // Treat the entry as a normal log message
        const bool inProgress = progressBar.is_initialized();
        if (inProgress) interruptProgressIndication();
        innerSink->receive(entry);
        if (inProgress) resumeProgressIndication();
    }
}

void NiceStderrSink::startProgressIndication() {
    progress = 0.0;
    progressBar = boost::in_place();
}

void NiceStderrSink::interruptProgressIndication() {
    progressBar.reset();
    std::cerr << std::endl;
}

void NiceStderrSink::resumeProgressIndication() {
    std::cerr << "Progress (cont'd): ";
    progressBar = boost::in_place(progress);
}
