#include "formatters.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

using std::string;

namespace logging {

string SimpleConsoleFormatter::format(const Entry& entry) {
    return fmt::format("[{0}] {1}", LevelConverter::get().toString(entry.level), entry.message);
}

string SimpleFileFormatter::format(const Entry& entry) {
    return fmt::format(
        "[{0:%F %H:%M:%S}] {1} {2}",
        fmt::localtime(entry.timestamp),
        entry.threadCounter,
        consoleFormatter.format(entry)
    );
}

} // namespace logging
