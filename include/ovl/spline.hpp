#pragma once
#include <vector>
#include "ovl/geometry.hpp"

namespace ovl {
	// Uniform Catmull-Rom curve through the control points. Open curves are padded
	// with duplicated end points; closed ones wrap around. The result always ends on
	// the exact endpoint (last point if open, first point if closed), so its length
	// is windows * samples_per_segment + 1.
	// Inputs with fewer than 2 points are returned unchanged.
    std::vector<Point2D> catmullRom(const std::vector<Point2D> &points, int samples_per_segment, bool closed = false);
}
