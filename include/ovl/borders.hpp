#pragma once
#include <vector>
#include "mapnik/image.hpp"
#include "ovl/geometry.hpp"

namespace ovl {
// lower bound on spline density once it has been multiplied by the supersample factor
constexpr int kMinSamplesPerSegment = 6;

struct BorderOptions {
    int supersample = 1;
    int samplesPerSegment = 10;
};

// Strokes every border (>= 2 points, others are skipped) onto a transparent layer
// supersample times larger than the canvas, downsamples it with a Lanczos filter and
// composites it source-over onto the canvas. Both images are premultiplied.
mapnik::image_rgba8 renderBorders(mapnik::image_rgba8 canvas, const std::vector<ColoredPolyline> &borders, const BorderOptions &opts);

// Aliased stroke with round joins. Covered pixels are overwritten with color, so
// overlapping segments of one line never darken each other.
void strokePolyline(mapnik::image_rgba8 &layer, const std::vector<Point2D> &points, const mapnik::color &color, double width);
}
