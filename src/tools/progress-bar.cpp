#include "progress-bar.h"

#include <fmt/format.h>

#include <algorithm>
#include <boost/algorithm/clamp.hpp>
#include <chrono>
#include <cmath>
#include <thread>

using std::string;

namespace {

double sanitizeProgress(double progress) {
    return std::isnan(progress) ? 0.0 : boost::algorithm::clamp(progress, 0.0, 1.0);
}

} // namespace

ProgressBar::ProgressBar(double progress) :
    ProgressBar(std::cerr, progress) {}

ProgressBar::ProgressBar(std::ostream& stream, double progress) :
    stream(stream) {
    currentProgress = sanitizeProgress(progress);
    updateLoopFuture = std::async(std::launch::async, &ProgressBar::updateLoop, this);
}

ProgressBar::~ProgressBar() {
    done = true;
    updateLoopFuture.wait();
}

void ProgressBar::reportProgress(double value) {
    currentProgress = sanitizeProgress(value);
}

void ProgressBar::updateLoop() {
    const std::chrono::milliseconds animationInterval(1000 / 8);

    while (!done) {
        update();
        std::this_thread::sleep_for(animationInterval);
    }

    if (clearOnDestruction) {
        updateText("");
    } else {
        update(false);
    }
}

void ProgressBar::update(bool showSpinner) {
    const int blockCount = 20;
    const string animation = "|/-\\";

    const double progress = currentProgress;
    const int progressBlockCount = static_cast<int>(progress * blockCount);
    const double epsilon = 0.0001;
    const int percent = static_cast<int>(progress * 100 + epsilon);
    const string spinner = showSpinner
        ? string(1, animation[animationIndex++ % animation.size()])
        : "";
    const string text = fmt::format(
        "[{0}{1}] {2:3}% {3}",
        string(progressBlockCount, '#'),
        string(blockCount - progressBlockCount, '-'),
        percent,
        spinner
    );
    updateText(text);
}

void ProgressBar::updateText(const string& text) {
    // Length of the portion shared with the text currently on screen
    size_t commonPrefixLength = 0;
    const size_t commonLength = std::min(currentText.size(), text.size());
    while (commonPrefixLength < commonLength
        && text[commonPrefixLength] == currentText[commonPrefixLength]) {
        commonPrefixLength++;
    }

    string output;

    // Backtrack to the first differing character, then write the new suffix
    output.append(currentText.size() - commonPrefixLength, '\b');
    output.append(text, commonPrefixLength, text.size() - commonPrefixLength);

    // Erase left-over characters if the new text is shorter
    const int overlapCount = static_cast<int>(currentText.size()) - static_cast<int>(text.size());
    if (overlapCount > 0) {
        output.append(overlapCount, ' ');
        output.append(overlapCount, '\b');
    }

    stream << output << std::flush;
    currentText = text;
}
