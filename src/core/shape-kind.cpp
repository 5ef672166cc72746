#include "shape-kind.h"

using std::string;

ShapeKindConverter& ShapeKindConverter::get() {
    static ShapeKindConverter converter;
    return converter;
}

string ShapeKindConverter::getTypeName() {
    return "ShapeKind";
}

EnumConverter<ShapeKind>::member_data ShapeKindConverter::getMemberData() {
    return member_data{
        {ShapeKind::Circle, "circle"},
        {ShapeKind::Square, "square"},
        {ShapeKind::Rectangle, "rectangle"},
        {ShapeKind::Ellipse, "ellipse"},
        {ShapeKind::Triangle, "triangle"},
        {ShapeKind::Line, "line"},
        {ShapeKind::Arrow, "arrow"},
        {ShapeKind::DoubleArrow, "double_arrow"},
        {ShapeKind::Vector, "vector"},
        {ShapeKind::Text, "text"},
        {ShapeKind::Group, "group"}
    };
}

std::ostream& operator<<(std::ostream& stream, ShapeKind value) {
    return ShapeKindConverter::get().write(stream, value);
}
