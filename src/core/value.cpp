#include "value.h"

#include <fmt/format.h>

#include <boost/algorithm/string/predicate.hpp>
#include <cctype>
#include <stdexcept>

using std::string;

Point operator+(Point a, Point b) {
    return Point(a.x + b.x, a.y + b.y);
}

Point operator-(Point a, Point b) {
    return Point(a.x - b.x, a.y - b.y);
}

Point operator*(Point a, double factor) {
    return Point(a.x * factor, a.y * factor);
}

std::ostream& operator<<(std::ostream& stream, const Point& point) {
    return stream << fmt::format("({:g}, {:g})", point.x, point.y);
}

Color Color::fromHex(const string& hex) {
    const string digits = boost::algorithm::starts_with(hex, "#") ? hex.substr(1) : hex;
    if (digits.size() != 6) {
        throw std::invalid_argument(fmt::format("Invalid hex color '{}'.", hex));
    }
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument(fmt::format("Invalid hex color '{}'.", hex));
        }
    }

    const auto channel = [&](size_t offset) {
        return static_cast<uint8_t>(std::stoi(digits.substr(offset, 2), nullptr, 16));
    };
    return Color(channel(0), channel(2), channel(4));
}

string Color::toHex() const {
    return fmt::format("#{:02X}{:02X}{:02X}", r, g, b);
}

std::ostream& operator<<(std::ostream& stream, const Color& color) {
    return stream << color.toHex();
}

ValueTypeConverter& ValueTypeConverter::get() {
    static ValueTypeConverter converter;
    return converter;
}

string ValueTypeConverter::getTypeName() {
    return "ValueType";
}

EnumConverter<ValueType>::member_data ValueTypeConverter::getMemberData() {
    return member_data{
        {ValueType::Number, "number"},
        {ValueType::Point, "point"},
        {ValueType::Color, "color"},
        {ValueType::Text, "text"}
    };
}

std::ostream& operator<<(std::ostream& stream, ValueType value) {
    return ValueTypeConverter::get().write(stream, value);
}

ValueType getValueType(const Value& value) {
    return static_cast<ValueType>(value.which());
}

namespace {

class ValueFormatter : public boost::static_visitor<string> {
public:
    string operator()(double number) const {
        return fmt::format("{:g}", number);
    }
    string operator()(const Point& point) const {
        return fmt::format("({:g}, {:g})", point.x, point.y);
    }
    string operator()(const Color& color) const {
        return color.toHex();
    }
    string operator()(const string& text) const {
        return fmt::format("\"{}\"", text);
    }
};

} // namespace

string formatValue(const Value& value) {
    return boost::apply_visitor(ValueFormatter(), value);
}
