#include <algorithm>
#include "ovl/spline.hpp"

using namespace std;

namespace ovl {
namespace {
double basis(double p0, double p1, double p2, double p3, double t) {
    double t2 = t * t;
    double t3 = t2 * t;
    return 0.5 * ((2 * p1) +
                  (-p0 + p2) * t +
                  (2 * p0 - 5 * p1 + 4 * p2 - p3) * t2 +
                  (-p0 + 3 * p1 - 3 * p2 + p3) * t3);
}
}

vector<Point2D> catmullRom(const vector<Point2D> &points, int samples_per_segment, bool closed) {
    if (points.size() < 2) return points;
    int samples = max(1, samples_per_segment);

    vector<Point2D> pts;
    pts.reserve(points.size() + 3);
    if (closed) {
        pts.push_back(points.back());
        pts.insert(pts.end(), points.begin(), points.end());
        pts.push_back(points[0]);
        pts.push_back(points[1]);
    } else {
        pts.push_back(points.front());
        pts.insert(pts.end(), points.begin(), points.end());
        pts.push_back(points.back());
    }

    vector<Point2D> out;
    out.reserve((pts.size() - 3) * samples + 1);
    for (size_t i = 1; i + 2 < pts.size(); i++) {
        const Point2D &p0 = pts[i - 1];
        const Point2D &p1 = pts[i];
        const Point2D &p2 = pts[i + 1];
        const Point2D &p3 = pts[i + 2];
        for (int j = 0; j < samples; j++) {
            double t = j / static_cast<double>(samples);
            out.push_back({basis(p0.x, p1.x, p2.x, p3.x, t), basis(p0.y, p1.y, p2.y, p3.y, t)});
        }
    }
    out.push_back(closed ? points.front() : points.back());
    return out;
}
}
