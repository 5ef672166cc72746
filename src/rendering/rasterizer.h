#pragma once

#include <vector>

#include "core/value.h"
#include "pixel-buffer.h"

using Polygon = std::vector<Point>;

// Rotation (degrees, clockwise on screen) and uniform scaling around a pivot
struct Transform {
    Point pivot;
    double rotation = 0;
    double scale = 1;

    Point apply(Point point) const;
    // Maps a transformed point back. Requires a non-zero scale.
    Point invert(Point point) const;
};

Polygon transformPolygon(const Polygon& polygon, const Transform& transform);

// Approximates an axis-aligned ellipse. The segment count grows with the on-screen size.
Polygon ellipsePolygon(Point center, double rx, double ry, double screenScale);

// Which pixels of a layer are covered. Coverage is sampled at pixel centers and accumulated as a
// union, so overlapping pieces of one layer are composited only once.
class CoverageMask {
public:
    CoverageMask(int width, int height);

    // Fills all contours together using the even-odd rule
    void fillPolygons(const std::vector<Polygon>& contours);
    void fillPolygon(const Polygon& polygon);

    // A stroke of the given width centered on the polyline, with round joins and caps
    void strokePolyline(const Polygon& points, double strokeWidth, bool closed);

    // Resets coverage, touching only the covered bounding box
    void clear();

    bool covers(int x, int y) const;
    bool empty() const;

    void composite(PixelBuffer& buffer, Color color, double opacity) const;

private:
    void cover(int x, int y);

    int width;
    int height;
    std::vector<uint8_t> coverage;
    int minX, minY, maxX, maxY;
};
