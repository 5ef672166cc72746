#include "parse-tree.h"

#include <fmt/format.h>

#include <stdexcept>

using std::string;

std::ostream& operator<<(std::ostream& stream, const TupleLiteral& tuple) {
    return stream << fmt::format("({:g}, {:g})", tuple.first, tuple.second);
}

std::ostream& operator<<(std::ostream& stream, const HexColorLiteral& hexColor) {
    return stream << "#" << hexColor.digits;
}

RawValueKindConverter& RawValueKindConverter::get() {
    static RawValueKindConverter converter;
    return converter;
}

string RawValueKindConverter::getTypeName() {
    return "RawValueKind";
}

EnumConverter<RawValueKind>::member_data RawValueKindConverter::getMemberData() {
    return member_data{
        {RawValueKind::Number, "number"},
        {RawValueKind::Tuple, "tuple"},
        {RawValueKind::HexColor, "hex color"},
        {RawValueKind::String, "string"}
    };
}

std::ostream& operator<<(std::ostream& stream, RawValueKind value) {
    return RawValueKindConverter::get().write(stream, value);
}

RawValueKind getRawValueKind(const RawValue& value) {
    return static_cast<RawValueKind>(value.which());
}

ValueType toValueType(RawValueKind kind) {
    switch (kind) {
        case RawValueKind::Number:
            return ValueType::Number;
        case RawValueKind::Tuple:
            return ValueType::Point;
        case RawValueKind::HexColor:
            return ValueType::Color;
        case RawValueKind::String:
            return ValueType::Text;
    }
    throw std::invalid_argument("Unsupported raw value kind.");
}

namespace {

class RawValueConverter : public boost::static_visitor<Value> {
public:
    Value operator()(double number) const {
        return number;
    }
    Value operator()(const TupleLiteral& tuple) const {
        return Point(tuple.first, tuple.second);
    }
    Value operator()(const HexColorLiteral& hexColor) const {
        return Color::fromHex(hexColor.digits);
    }
    Value operator()(const string& text) const {
        return text;
    }
};

} // namespace

Value toValue(const RawValue& rawValue) {
    return boost::apply_visitor(RawValueConverter(), rawValue);
}
