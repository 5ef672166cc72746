#include "scene-builder.h"

#include <fmt/format.h>

#include <cmath>
#include <set>
#include <utility>

#include "core/errors.h"
#include "core/property-schema.h"
#include "logging/logging.h"

using boost::optional;
using std::set;
using std::string;
using std::vector;

namespace {

string describeObject(const ObjectDeclaration& object, const SceneDeclaration& scene) {
    return fmt::format(
        "object \"{}\" in scene \"{}\", line {}", object.id, scene.name, object.location.line
    );
}

string describeScene(const SceneDeclaration& scene) {
    return fmt::format("scene \"{}\", line {}", scene.name, scene.location.line);
}

string describeCamera(const PropertyDeclaration& property) {
    return fmt::format("camera, line {}", property.location.line);
}

SceneObject buildObject(const ObjectDeclaration& object, const SceneDeclaration& scene) {
    const string context = describeObject(object, scene);
    const optional<ShapeKind> shapeKind = ShapeKindConverter::get().tryParse(object.shape);
    if (!shapeKind) {
        throw UnknownShape(object.shape, context);
    }
    const string shapeName = ShapeKindConverter::get().toString(*shapeKind);
    const PropertySchema& schema = PropertySchema::get(*shapeKind);

    PropertySet properties;
    for (const PropertyDeclaration& property : object.properties) {
        const PropertySpec* spec = schema.find(property.name);
        if (!spec) {
            throw UnknownProperty(shapeName, property.name, context);
        }
        if (properties.contains(property.name)) {
            throw DuplicateProperty(property.name, context);
        }
        const RawValueKind kind = getRawValueKind(property.value);
        if (toValueType(kind) != spec->type) {
            throw SchemaTypeMismatch(
                shapeName,
                property.name,
                spec->type,
                RawValueKindConverter::get().toString(kind),
                context
            );
        }
        properties.set(property.name, toValue(property.value));
    }

    for (const auto& entry : schema.getProperties()) {
        const PropertySpec& spec = entry.second;
        if (!properties.contains(entry.first) && spec.defaultValue) {
            properties.set(entry.first, *spec.defaultValue);
        }
    }

    return SceneObject{object.id, *shapeKind, properties, object.location};
}

int toPixelCount(const PropertyDeclaration& property, double value) {
    if (value <= 0 || std::floor(value) != value) {
        throw InvalidPropertyValue(
            property.name,
            fmt::format("expected a positive whole number of pixels, got {:g}.", value),
            describeCamera(property)
        );
    }
    if (value > 65536) {
        throw InvalidPropertyValue(
            property.name,
            fmt::format("{:g} pixels exceeds the maximum of 65536.", value),
            describeCamera(property)
        );
    }
    return static_cast<int>(value);
}

} // namespace

Scene buildScene(const SceneDeclaration& declaration) {
    logging::debugFormat("Building scene \"{}\".", declaration.name);

    if (declaration.duration && *declaration.duration <= seconds::zero()) {
        throw NonPositiveDuration(*declaration.duration, describeScene(declaration));
    }

    vector<SceneObject> objects;
    set<string> ids;
    for (const ObjectDeclaration& object : declaration.objects) {
        if (!ids.insert(object.id).second) {
            throw DuplicateObjectId(object.id, describeObject(object, declaration));
        }
        objects.push_back(buildObject(object, declaration));
    }

    logging::debugFormat("Scene \"{}\" has {} objects.", declaration.name, objects.size());
    return Scene(declaration.name, declaration.duration, std::move(objects));
}

Camera buildCamera(const optional<CameraDeclaration>& declaration) {
    Camera camera;
    if (!declaration) return camera;

    set<string> seen;
    for (const PropertyDeclaration& property : declaration->properties) {
        if (!seen.insert(property.name).second) {
            throw DuplicateProperty(property.name, describeCamera(property));
        }

        const RawValueKind kind = getRawValueKind(property.value);
        const auto requireKind = [&](ValueType expected) {
            if (toValueType(kind) != expected) {
                throw SchemaTypeMismatch(
                    "camera",
                    property.name,
                    expected,
                    RawValueKindConverter::get().toString(kind),
                    describeCamera(property)
                );
            }
        };

        if (property.name == "width" || property.name == "height") {
            requireKind(ValueType::Number);
            const int pixelCount = toPixelCount(property, boost::get<double>(property.value));
            (property.name == "width" ? camera.width : camera.height) = pixelCount;
        } else if (property.name == "background_color") {
            requireKind(ValueType::Color);
            camera.backgroundColor = boost::get<Color>(toValue(property.value));
        } else {
            logging::warnFormat(
                "Ignoring unknown camera property '{}' in line {}.",
                property.name,
                property.location.line
            );
        }
    }

    logging::debugFormat(
        "Camera: {}x{}, background {}.",
        camera.width,
        camera.height,
        camera.backgroundColor.toHex()
    );
    return camera;
}
