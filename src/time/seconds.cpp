#include "seconds.h"

#include <fmt/format.h>

namespace std {

std::ostream& operator<<(std::ostream& stream, const seconds s) {
    return stream << formatDuration(s);
}

} // namespace std

std::string formatDuration(seconds s) {
    return fmt::format("{:g}s", s.count());
}
