#pragma once

#include <ostream>

// 1-based position within the script text
struct SourceLocation {
    int line = 0;
    int column = 0;

    bool operator==(const SourceLocation& rhs) const {
        return line == rhs.line && column == rhs.column;
    }
    bool operator!=(const SourceLocation& rhs) const {
        return !operator==(rhs);
    }
};

inline std::ostream& operator<<(std::ostream& stream, const SourceLocation& location) {
    return stream << location.line << ":" << location.column;
}
