#include "renderer.h"

#include <fmt/format.h>

#include <algorithm>
#include <boost/algorithm/clamp.hpp>
#include <boost/optional.hpp>
#include <cmath>
#include <utility>

#include "core/errors.h"
#include "rasterizer.h"

using boost::optional;
using std::vector;

namespace {

const double pi = std::acos(-1.0);

// The outline and stroke of one object in object space, plus how to place it on screen
struct ObjectGeometry {
    Transform transform;
    // Closed outline, for fill and border
    optional<Polygon> outline;
    // Open polyline and arrowheads, drawn in the border color
    optional<Polygon> line;
    vector<Polygon> arrowheads;
};

Transform getTransform(const PropertySet& properties, Point pivot) {
    Transform transform;
    transform.pivot = pivot;
    transform.rotation = properties.getNumber("rotation");
    transform.scale = properties.getNumber("scale");
    return transform;
}

Polygon rectanglePolygon(Point center, double halfWidth, double halfHeight) {
    return {
        Point(center.x - halfWidth, center.y - halfHeight),
        Point(center.x + halfWidth, center.y - halfHeight),
        Point(center.x + halfWidth, center.y + halfHeight),
        Point(center.x - halfWidth, center.y + halfHeight)
    };
}

Point centroid(const Polygon& points) {
    Point sum;
    for (const Point& point : points) {
        sum = sum + point;
    }
    return sum * (1.0 / points.size());
}

// A triangle with its tip at `to`, opening back towards `from`
Polygon arrowhead(Point from, Point to, double tipLength, double tipAngle) {
    const double lineAngle = std::atan2(to.y - from.y, to.x - from.x);
    const double spread = tipAngle * pi / 180.0;
    const auto wingPoint = [&](double angle) {
        return to + Point(std::cos(angle), std::sin(angle)) * tipLength;
    };
    return {to, wingPoint(lineAngle + pi - spread), wingPoint(lineAngle + pi + spread)};
}

ObjectGeometry lineGeometry(
    const PropertySet& properties,
    Point from,
    Point to,
    bool tipAtEnd,
    bool tipAtStart,
    optional<Point> pivot
) {
    ObjectGeometry geometry;
    geometry.transform = getTransform(properties, pivot.value_or(centroid({from, to})));
    geometry.line = Polygon{from, to};
    if (tipAtEnd || tipAtStart) {
        const double tipLength = properties.getNumber("tip_length");
        const double tipAngle = properties.getNumber("tip_angle");
        if (tipAtEnd) geometry.arrowheads.push_back(arrowhead(from, to, tipLength, tipAngle));
        if (tipAtStart) geometry.arrowheads.push_back(arrowhead(to, from, tipLength, tipAngle));
    }
    return geometry;
}

ObjectGeometry closedGeometry(const PropertySet& properties, Point pivot, Polygon outline) {
    ObjectGeometry geometry;
    geometry.transform = getTransform(properties, pivot);
    geometry.outline = std::move(outline);
    return geometry;
}

double getScreenScale(const PropertySet& properties) {
    return std::abs(properties.getNumber("scale"));
}

ObjectGeometry getGeometry(const ObjectState& object) {
    const PropertySet& properties = object.properties;
    switch (object.shapeKind) {
        case ShapeKind::Circle: {
            const Point position = properties.getPoint("position");
            const double radius = properties.getNumber("radius");
            return closedGeometry(
                properties,
                position,
                ellipsePolygon(position, radius, radius, getScreenScale(properties))
            );
        }
        case ShapeKind::Square: {
            const Point position = properties.getPoint("position");
            const double halfSize = properties.getNumber("size") / 2;
            return closedGeometry(
                properties, position, rectanglePolygon(position, halfSize, halfSize)
            );
        }
        case ShapeKind::Rectangle: {
            const Point position = properties.getPoint("position");
            return closedGeometry(
                properties,
                position,
                rectanglePolygon(
                    position, properties.getNumber("width") / 2, properties.getNumber("height") / 2
                )
            );
        }
        case ShapeKind::Ellipse: {
            const Point position = properties.getPoint("position");
            return closedGeometry(
                properties,
                position,
                ellipsePolygon(
                    position,
                    properties.getNumber("rx"),
                    properties.getNumber("ry"),
                    getScreenScale(properties)
                )
            );
        }
        case ShapeKind::Triangle: {
            Polygon points{
                properties.getPoint("p1"), properties.getPoint("p2"), properties.getPoint("p3")
            };
            const Point pivot = properties.tryGetPoint("position").value_or(centroid(points));
            return closedGeometry(properties, pivot, std::move(points));
        }
        case ShapeKind::Line:
        case ShapeKind::Arrow:
        case ShapeKind::DoubleArrow:
            return lineGeometry(
                properties,
                properties.getPoint("p1"),
                properties.getPoint("p2"),
                object.shapeKind != ShapeKind::Line,
                object.shapeKind == ShapeKind::DoubleArrow,
                properties.tryGetPoint("position")
            );
        case ShapeKind::Vector: {
            const Point tail = properties.getPoint("position");
            return lineGeometry(
                properties, tail, tail + properties.getPoint("direction"), true, false, tail
            );
        }
        case ShapeKind::Text:
        case ShapeKind::Group:
            return ObjectGeometry();
    }
    throw InvariantViolation("Unsupported shape kind.");
}

// Draws each layer through the frame's shared mask, which is left clear afterwards
void drawGeometry(
    PixelBuffer& buffer,
    CoverageMask& mask,
    const ObjectState& object,
    const ObjectGeometry& geometry,
    double opacity
) {
    const PropertySet& properties = object.properties;
    const Transform& transform = geometry.transform;
    const double screenScale = std::abs(transform.scale);

    if (geometry.outline) {
        const Polygon outline = transformPolygon(*geometry.outline, transform);
        if (const optional<Color> fill = properties.tryGetColor("fill")) {
            mask.fillPolygon(outline);
            mask.composite(buffer, *fill, opacity);
            mask.clear();
        }
        if (const optional<Color> borderColor = properties.tryGetColor("border_color")) {
            mask.strokePolyline(outline, properties.getNumber("border_width") * screenScale, true);
            mask.composite(buffer, *borderColor, opacity);
            mask.clear();
        }
    }

    if (geometry.line) {
        const optional<Color> borderColor = properties.tryGetColor("border_color");
        if (!borderColor) return;

        const double strokeWidth = properties.getNumber("border_width") * screenScale;
        mask.strokePolyline(transformPolygon(*geometry.line, transform), strokeWidth, false);
        for (const Polygon& arrowhead : geometry.arrowheads) {
            const Polygon screenArrowhead = transformPolygon(arrowhead, transform);
            mask.fillPolygon(screenArrowhead);
            mask.strokePolyline(screenArrowhead, strokeWidth, true);
        }
        mask.composite(buffer, *borderColor, opacity);
        mask.clear();
    }
}

void drawText(
    PixelBuffer& buffer,
    const ObjectState& object,
    const GlyphRasterizer& glyphRasterizer,
    double opacity
) {
    const PropertySet& properties = object.properties;
    const GlyphRun run =
        glyphRasterizer.rasterize(properties.getText("content"), properties.getNumber("font_size"));
    if (run.width == 0 || run.height == 0) return;

    const Point position = properties.getPoint("position");
    const Transform transform = getTransform(properties, position);
    if (transform.scale == 0) return;

    // The run is centered on the position
    const Point origin = position - Point(run.width / 2.0, run.height / 2.0);
    const Polygon bounds = transformPolygon(
        {
            origin,
            origin + Point(run.width, 0),
            origin + Point(run.width, run.height),
            origin + Point(0, run.height)
        },
        transform
    );
    double left = buffer.getWidth(), top = buffer.getHeight(), right = 0, bottom = 0;
    for (const Point& corner : bounds) {
        left = std::min(left, corner.x);
        top = std::min(top, corner.y);
        right = std::max(right, corner.x);
        bottom = std::max(bottom, corner.y);
    }

    const Color fill = properties.getColor("fill");
    const double width = buffer.getWidth();
    const double height = buffer.getHeight();
    const int firstX = static_cast<int>(std::floor(boost::algorithm::clamp(left, 0.0, width)));
    const int firstY = static_cast<int>(std::floor(boost::algorithm::clamp(top, 0.0, height)));
    const int endX = static_cast<int>(std::ceil(boost::algorithm::clamp(right, 0.0, width)));
    const int endY = static_cast<int>(std::ceil(boost::algorithm::clamp(bottom, 0.0, height)));
    for (int y = firstY; y < endY; ++y) {
        for (int x = firstX; x < endX; ++x) {
            const Point sample = transform.invert(Point(x + 0.5, y + 0.5)) - origin;
            const uint8_t coverage = run.getCoverage(
                static_cast<int>(std::floor(sample.x)), static_cast<int>(std::floor(sample.y))
            );
            if (coverage > 0) {
                buffer.blendPixel(x, y, fill, opacity * coverage / 255.0);
            }
        }
    }
}

void drawObject(
    PixelBuffer& buffer,
    CoverageMask& mask,
    const ObjectState& object,
    const GlyphRasterizer* glyphRasterizer
) {
    const double opacity =
        boost::algorithm::clamp(object.properties.getNumber("opacity"), 0.0, 1.0);
    if (opacity == 0) return;

    if (object.shapeKind == ShapeKind::Text) {
        if (glyphRasterizer) {
            drawText(buffer, object, *glyphRasterizer, opacity);
        }
        return;
    }

    drawGeometry(buffer, mask, object, getGeometry(object), opacity);
}

} // namespace

PixelBuffer renderSnapshot(
    const FrameSnapshot& snapshot, const Camera& camera, const GlyphRasterizer* glyphRasterizer
) {
    PixelBuffer buffer(camera.width, camera.height, camera.backgroundColor);
    CoverageMask mask(camera.width, camera.height);
    for (const ObjectState& object : snapshot.objects) {
        try {
            drawObject(buffer, mask, object, glyphRasterizer);
        } catch (const InvariantViolation&) {
            std::throw_with_nested(InvariantViolation(fmt::format(
                "Failed to draw {} \"{}\" in frame {}.",
                ShapeKindConverter::get().toString(object.shapeKind),
                object.id,
                snapshot.index
            )));
        }
    }
    return buffer;
}
