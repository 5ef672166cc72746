#pragma once

#include <boost/variant.hpp>
#include <cstdint>
#include <ostream>
#include <string>

#include "tools/enum-converter.h"

struct Point {
    Point() = default;
    Point(double x, double y) :
        x(x),
        y(y) {}

    double x = 0;
    double y = 0;

    bool operator==(const Point& rhs) const {
        return x == rhs.x && y == rhs.y;
    }
    bool operator!=(const Point& rhs) const {
        return !operator==(rhs);
    }
};

Point operator+(Point a, Point b);
Point operator-(Point a, Point b);
Point operator*(Point a, double factor);

std::ostream& operator<<(std::ostream& stream, const Point& point);

struct Color {
    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b) :
        r(r),
        g(g),
        b(b) {}

    // Parses "RRGGBB", with or without a leading '#'
    static Color fromHex(const std::string& hex);
    std::string toHex() const;

    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color& rhs) const {
        return r == rhs.r && g == rhs.g && b == rhs.b;
    }
    bool operator!=(const Color& rhs) const {
        return !operator==(rhs);
    }
};

std::ostream& operator<<(std::ostream& stream, const Color& color);

// The order of alternatives matches ValueType.
using Value = boost::variant<double, Point, Color, std::string>;

enum class ValueType { Number, Point, Color, Text };

class ValueTypeConverter : public EnumConverter<ValueType> {
public:
    static ValueTypeConverter& get();

protected:
    std::string getTypeName() override;
    member_data getMemberData() override;
};

std::ostream& operator<<(std::ostream& stream, ValueType value);

ValueType getValueType(const Value& value);

std::string formatValue(const Value& value);
