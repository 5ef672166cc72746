#include "progress.h"

#include <utility>

ProgressForwarder::ProgressForwarder(std::function<void(double progress)> callback) :
    callback(std::move(callback)) {}

void ProgressForwarder::reportProgress(double value) {
    callback(value);
}
