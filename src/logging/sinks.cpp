#include "sinks.h"

#include <iostream>
#include <string>
#include <utility>

using std::shared_ptr;
using std::string;

namespace logging {

LevelFilter::LevelFilter(shared_ptr<Sink> innerSink, Level minLevel) :
    innerSink(std::move(innerSink)),
    minLevel(minLevel) {}

void LevelFilter::receive(const Entry& entry) {
    if (entry.level >= minLevel) {
        innerSink->receive(entry);
    }
}

StreamSink::StreamSink(shared_ptr<std::ostream> stream, shared_ptr<Formatter> formatter) :
    stream(std::move(stream)),
    formatter(std::move(formatter)) {}

void StreamSink::receive(const Entry& entry) {
    const string line = formatter->format(entry);
    *stream << line << std::endl;
}

StdErrSink::StdErrSink(shared_ptr<Formatter> formatter) :
    StreamSink(shared_ptr<std::ostream>(&std::cerr, [](void*) {}), std::move(formatter)) {}

} // namespace logging
