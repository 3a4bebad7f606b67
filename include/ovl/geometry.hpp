#pragma once
#include <vector>
#include "mapnik/color.hpp"

namespace ovl {
// image pixel space, origin top-left, y down
struct Point2D {
    double x;
    double y;
};

inline bool operator==(const Point2D &a, const Point2D &b) {
    return a.x == b.x && a.y == b.y;
}

struct ColoredPolyline {
    std::vector<Point2D> points;
    mapnik::color color;
    int width;
    bool closed = false;
};
}
