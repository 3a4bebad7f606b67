#include <doctest/doctest.h>

#include "ovl/spline.hpp"

using ovl::Point2D;
using ovl::catmullRom;

TEST_CASE("catmullRom: open curve starts and ends exactly on the control points")
{
    std::vector<Point2D> pts = {{3.25, -1.5}, {40.0, 12.0}, {17.5, 80.125}, {90.0, 91.0}};
    for (int samples : {1, 2, 7, 12, 30}) {
        auto out = catmullRom(pts, samples);
        REQUIRE(!out.empty());
        CHECK(out.front() == pts.front());
        CHECK(out.back() == pts.back());
    }
}

TEST_CASE("catmullRom: output length is (n-1)*s + 1 for open curves")
{
    std::vector<Point2D> pts;
    for (int n = 2; n <= 6; n++) {
        pts.push_back({n * 10.0, n * n * 1.0});
        if (pts.size() < 2) continue;
        for (int s = 1; s <= 12; s++) {
            CHECK(catmullRom(pts, s).size() == (pts.size() - 1) * s + 1);
        }
    }
}

TEST_CASE("catmullRom: fewer than two points come back unchanged")
{
    std::vector<Point2D> none;
    CHECK(catmullRom(none, 10).empty());

    std::vector<Point2D> one = {{4.0, 5.0}};
    auto out = catmullRom(one, 10);
    REQUIRE(out.size() == 1);
    CHECK(out[0] == one[0]);
}

TEST_CASE("catmullRom: every window passes through its control point")
{
    std::vector<Point2D> pts = {{0, 0}, {10, 0}, {10, 10}, {25, 4}};
    int s = 8;
    auto out = catmullRom(pts, s);
    for (size_t i = 0; i + 1 < pts.size(); i++) {
        CHECK(out[i * s].x == doctest::Approx(pts[i].x));
        CHECK(out[i * s].y == doctest::Approx(pts[i].y));
    }
}

TEST_CASE("catmullRom: collinear evenly spaced points stay on the line")
{
    std::vector<Point2D> pts = {{0, 5}, {10, 5}, {20, 5}, {30, 5}};
    auto out = catmullRom(pts, 5);
    for (const auto &p : out) {
        CHECK(p.y == doctest::Approx(5.0));
        CHECK(p.x >= -1e-9);
        CHECK(p.x <= 30.0 + 1e-9);
    }
    // interior segment is linear in t
    CHECK(out[5 + 2].x == doctest::Approx(14.0));
}

TEST_CASE("catmullRom: closed curve wraps around and returns to the start")
{
    std::vector<Point2D> pts = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    int s = 6;
    auto out = catmullRom(pts, s, true);
    CHECK(out.size() == pts.size() * s + 1);
    CHECK(out.front() == pts.front());
    CHECK(out.back() == pts.front());
    // the closing window runs from the last point back to the first
    CHECK(out[3 * s].x == doctest::Approx(0.0));
    CHECK(out[3 * s].y == doctest::Approx(10.0));
}

TEST_CASE("catmullRom: non-positive sample counts behave like one sample")
{
    std::vector<Point2D> pts = {{0, 0}, {10, 0}, {10, 10}};
    CHECK(catmullRom(pts, 0) == catmullRom(pts, 1));
    CHECK(catmullRom(pts, -4).size() == 3);
}
