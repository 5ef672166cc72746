#include "property-schema.h"

#include <stdexcept>
#include <utility>
#include <vector>

using boost::none;
using std::map;
using std::string;
using std::vector;

namespace {

using Properties = map<string, PropertySpec>;

const Color white(0xFF, 0xFF, 0xFF);

PropertySpec number(double defaultValue) {
    return {ValueType::Number, Value(defaultValue)};
}

PropertySpec point(Point defaultValue) {
    return {ValueType::Point, Value(defaultValue)};
}

PropertySpec optionalPoint() {
    return {ValueType::Point, none};
}

PropertySpec color(Color defaultValue) {
    return {ValueType::Color, Value(defaultValue)};
}

PropertySpec optionalColor() {
    return {ValueType::Color, none};
}

PropertySpec text(const string& defaultValue) {
    return {ValueType::Text, Value(defaultValue)};
}

Properties merge(vector<Properties> parts) {
    Properties result;
    for (auto& part : parts) {
        result.insert(part.begin(), part.end());
    }
    return result;
}

Properties transformProperties() {
    return {{"rotation", number(0)}, {"scale", number(1)}, {"opacity", number(1)}};
}

Properties closedShapeProperties() {
    return {
        {"fill", optionalColor()},
        {"border_color", optionalColor()},
        {"border_width", number(2)}
    };
}

Properties lineProperties() {
    return {
        {"p1", point({0, 0})},
        {"p2", point({50, 50})},
        {"position", optionalPoint()},
        {"border_color", color(white)},
        {"border_width", number(2)}
    };
}

Properties arrowTipProperties() {
    return {{"tip_length", number(15)}, {"tip_angle", number(30)}};
}

Properties createProperties(ShapeKind shapeKind) {
    switch (shapeKind) {
        case ShapeKind::Circle:
            return merge({
                transformProperties(),
                closedShapeProperties(),
                Properties{{"position", point({0, 0})}, {"radius", number(50)}}
            });
        case ShapeKind::Square:
            return merge({
                transformProperties(),
                closedShapeProperties(),
                Properties{{"position", point({0, 0})}, {"size", number(100)}}
            });
        case ShapeKind::Rectangle:
            return merge({
                transformProperties(),
                closedShapeProperties(),
                Properties{
                    {"position", point({0, 0})},
                    {"width", number(100)},
                    {"height", number(50)}
                }
            });
        case ShapeKind::Ellipse:
            return merge({
                transformProperties(),
                closedShapeProperties(),
                Properties{{"position", point({0, 0})}, {"rx", number(50)}, {"ry", number(25)}}
            });
        case ShapeKind::Triangle:
            return merge({
                transformProperties(),
                closedShapeProperties(),
                Properties{
                    {"p1", point({0, 0})},
                    {"p2", point({50, 50})},
                    {"p3", point({0, 50})},
                    {"position", optionalPoint()}
                }
            });
        case ShapeKind::Line:
            return merge({transformProperties(), lineProperties()});
        case ShapeKind::Arrow:
        case ShapeKind::DoubleArrow:
            return merge({transformProperties(), lineProperties(), arrowTipProperties()});
        case ShapeKind::Vector:
            return merge({
                transformProperties(),
                arrowTipProperties(),
                Properties{
                    {"position", point({0, 0})},
                    {"direction", point({50, 50})},
                    {"border_color", color(white)},
                    {"border_width", number(2)}
                }
            });
        case ShapeKind::Text:
            return merge({
                transformProperties(),
                Properties{
                    {"position", point({0, 0})},
                    {"content", text("")},
                    {"font_size", number(32)},
                    {"fill", color(white)}
                }
            });
        case ShapeKind::Group:
            return merge({transformProperties(), Properties{{"position", point({0, 0})}}});
    }
    throw std::invalid_argument("Unsupported shape kind.");
}

map<ShapeKind, PropertySchema> createSchemas() {
    map<ShapeKind, PropertySchema> schemas;
    for (ShapeKind shapeKind : ShapeKindConverter::get().getValues()) {
        schemas.emplace(shapeKind, PropertySchema(createProperties(shapeKind)));
    }
    return schemas;
}

} // namespace

const PropertySchema& PropertySchema::get(ShapeKind shapeKind) {
    static const map<ShapeKind, PropertySchema> schemas = createSchemas();
    return schemas.at(shapeKind);
}

PropertySchema::PropertySchema(map<string, PropertySpec> properties) :
    properties(std::move(properties)) {}

const PropertySpec* PropertySchema::find(const string& propertyName) const {
    const auto it = properties.find(propertyName);
    return it != properties.end() ? &it->second : nullptr;
}
