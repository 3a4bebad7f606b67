#pragma once
#include <string>
#include "mapnik/image.hpp"
#include "mapnik/image_view.hpp"
#include "ovl/config.hpp"

namespace ovl {
// Encode straight-alpha pixels. PNG keeps alpha; JPEG drops it and is written
// 4:4:4 without Huffman optimisation so thin lines and text stay sharp.
// T is mapnik::image_rgba8 or mapnik::image_view_rgba8. Throws ExportError.
template <typename T>
std::string encodeImage(const T &image, const ExportOptions &opts);

template <typename T>
void saveImage(const T &image, const std::string &path, const ExportOptions &opts);

// Writes bytes to path, throwing ExportError if the file cannot be written.
void writeFile(const std::string &path, const std::string &bytes);

// Straight-alpha copy of a premultiplied canvas, resampled by scale when scale != 1.
mapnik::image_rgba8 prepareForExport(const mapnik::image_rgba8 &canvas, double scale);
}
