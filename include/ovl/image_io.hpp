#pragma once
#include <optional>
#include <string>
#include "mapnik/image.hpp"

namespace ovl {
constexpr double kDefaultDpi = 96.0;

// Decode any format mapnik has a reader for. The result is premultiplied,
// ready for mapnik::composite. Throws AssetError.
mapnik::image_rgba8 loadImage(const std::string &path);

// Print resolution stored in a PNG pHYs chunk or a JPEG JFIF header, if any.
std::optional<double> readDpi(const std::string &path);

// typographic points (1/72 inch) to pixels
int pointsToPixels(double points, double dpi);
}
