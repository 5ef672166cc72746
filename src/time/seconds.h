#pragma once

#include <chrono>
#include <ostream>
#include <string>

// Script time. Authored times have millisecond resolution, frame timestamps are arbitrary.
using seconds = std::chrono::duration<double>;

// Needs to be in the same namespace as std::chrono::duration, or googletest won't pick it up.
namespace std {

std::ostream& operator<<(std::ostream& stream, seconds s);

} // namespace std

std::string formatDuration(seconds s);

inline constexpr seconds operator"" _s(unsigned long long s) {
    return seconds(static_cast<double>(s));
}

inline constexpr seconds operator"" _s(long double s) {
    return seconds(static_cast<double>(s));
}

inline constexpr seconds operator"" _ms(unsigned long long ms) {
    return seconds(static_cast<double>(ms) / 1000.0);
}
