#include "rasterizer.h"

#include <boost/algorithm/clamp.hpp>
#include <algorithm>
#include <cmath>

using std::vector;

namespace {

const double pi = std::acos(-1.0);

double toRadians(double degrees) {
    return degrees * pi / 180.0;
}

} // namespace

Point Transform::apply(Point point) const {
    const double angle = toRadians(rotation);
    const double cosine = std::cos(angle);
    const double sine = std::sin(angle);
    const Point offset = (point - pivot) * scale;
    return pivot + Point(offset.x * cosine - offset.y * sine, offset.x * sine + offset.y * cosine);
}

Point Transform::invert(Point point) const {
    const double angle = toRadians(rotation);
    const double cosine = std::cos(angle);
    const double sine = std::sin(angle);
    const Point offset = point - pivot;
    const Point unrotated(
        offset.x * cosine + offset.y * sine, -offset.x * sine + offset.y * cosine
    );
    return pivot + unrotated * (1 / scale);
}

Polygon transformPolygon(const Polygon& polygon, const Transform& transform) {
    Polygon result;
    result.reserve(polygon.size());
    for (const Point& point : polygon) {
        result.push_back(transform.apply(point));
    }
    return result;
}

Polygon ellipsePolygon(Point center, double rx, double ry, double screenScale) {
    // Roughly one segment per two pixels of circumference
    const double screenRadius = std::max(std::abs(rx), std::abs(ry)) * std::abs(screenScale);
    const double segments = std::isnan(screenRadius) ? 0.0 : std::ceil(pi * screenRadius);
    const int segmentCount = static_cast<int>(boost::algorithm::clamp(segments, 16.0, 720.0));

    Polygon polygon;
    polygon.reserve(segmentCount);
    for (int i = 0; i < segmentCount; ++i) {
        const double angle = 2 * pi * i / segmentCount;
        polygon.emplace_back(center.x + rx * std::cos(angle), center.y + ry * std::sin(angle));
    }
    return polygon;
}

CoverageMask::CoverageMask(int width, int height) :
    width(width),
    height(height),
    coverage(static_cast<size_t>(width) * height, 0),
    minX(width),
    minY(height),
    maxX(-1),
    maxY(-1) {}

void CoverageMask::clear() {
    for (int y = minY; y <= maxY; ++y) {
        const auto row = coverage.begin() + static_cast<size_t>(y) * width;
        std::fill(row + minX, row + maxX + 1, 0);
    }
    minX = width;
    minY = height;
    maxX = -1;
    maxY = -1;
}

void CoverageMask::cover(int x, int y) {
    coverage[static_cast<size_t>(y) * width + x] = 1;
    minX = std::min(minX, x);
    minY = std::min(minY, y);
    maxX = std::max(maxX, x);
    maxY = std::max(maxY, y);
}

void CoverageMask::fillPolygons(const vector<Polygon>& contours) {
    double top = height;
    double bottom = 0;
    for (const Polygon& contour : contours) {
        for (const Point& point : contour) {
            if (!std::isfinite(point.x) || !std::isfinite(point.y)) return;
            top = std::min(top, point.y);
            bottom = std::max(bottom, point.y);
        }
    }
    const int firstRow =
        static_cast<int>(std::floor(boost::algorithm::clamp(top, 0.0, double(height))));
    const int lastRow = std::min(
        height - 1,
        static_cast<int>(std::ceil(boost::algorithm::clamp(bottom, 0.0, double(height))))
    );

    vector<double> crossings;
    for (int y = firstRow; y <= lastRow; ++y) {
        const double sampleY = y + 0.5;

        crossings.clear();
        for (const Polygon& contour : contours) {
            const size_t count = contour.size();
            if (count < 3) continue;
            for (size_t i = 0; i < count; ++i) {
                const Point& a = contour[i];
                const Point& b = contour[(i + 1) % count];
                if ((a.y <= sampleY) != (b.y <= sampleY)) {
                    crossings.push_back(a.x + (sampleY - a.y) / (b.y - a.y) * (b.x - a.x));
                }
            }
        }
        std::sort(crossings.begin(), crossings.end());

        // Pixel x is inside a span if its center x + 0.5 lies in [left, right)
        for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
            const double left = boost::algorithm::clamp(crossings[i] - 0.5, -1.0, double(width));
            const double right =
                boost::algorithm::clamp(crossings[i + 1] - 0.5, -1.0, double(width));
            const int firstX = std::max(0, static_cast<int>(std::ceil(left)));
            const int endX = static_cast<int>(std::ceil(right));
            for (int x = firstX; x < endX; ++x) {
                cover(x, y);
            }
        }
    }
}

void CoverageMask::fillPolygon(const Polygon& polygon) {
    fillPolygons({polygon});
}

void CoverageMask::strokePolyline(const Polygon& points, double strokeWidth, bool closed) {
    if (points.empty() || !(strokeWidth > 0)) return;

    const double halfWidth = strokeWidth / 2;
    const size_t segmentCount = closed ? points.size() : points.size() - 1;
    for (size_t i = 0; i < segmentCount; ++i) {
        const Point& a = points[i];
        const Point& b = points[(i + 1) % points.size()];
        const Point direction = b - a;
        const double length = std::hypot(direction.x, direction.y);
        if (length == 0) continue;

        const Point normal = Point(-direction.y, direction.x) * (halfWidth / length);
        fillPolygon({a + normal, b + normal, b - normal, a - normal});
    }

    // Joins and caps
    for (const Point& point : points) {
        fillPolygon(ellipsePolygon(point, halfWidth, halfWidth, 1));
    }
}

bool CoverageMask::covers(int x, int y) const {
    if (x < 0 || x >= width || y < 0 || y >= height) return false;
    return coverage[static_cast<size_t>(y) * width + x] != 0;
}

bool CoverageMask::empty() const {
    return maxX < minX;
}

void CoverageMask::composite(PixelBuffer& buffer, Color color, double opacity) const {
    for (int y = minY; y <= maxY; ++y) {
        for (int x = minX; x <= maxX; ++x) {
            if (coverage[static_cast<size_t>(y) * width + x]) {
                buffer.blendPixel(x, y, color, opacity);
            }
        }
    }
}
