#pragma once

#include "core/value.h"

// Blends two values of the same type. Progress is expected in [0, 1]; at or below 0 the start
// value is returned exactly, at or above 1 the end value.
// Text cannot be blended and switches to the end value only once progress reaches 1.
// Throws InvariantViolation if the values are of different types.
Value interpolate(const Value& start, const Value& end, double progress);

double interpolate(double start, double end, double progress);
Point interpolate(Point start, Point end, double progress);
Color interpolate(Color start, Color end, double progress);
