#pragma once
#include <memory>
#include <string>
#include <vector>
#include "mapnik/image.hpp"
#include "ovl/annotate.hpp"
#include "ovl/config.hpp"
#include "ovl/dataset.hpp"
#include "ovl/geometry.hpp"
#include "ovl/text.hpp"

namespace ovl {
struct AssetPaths {
    std::string map;
    std::string font;
    std::string portalIcon;
    std::string steddingIcon;
    std::string dataset;
};

struct Sprites {
    mapnik::image_rgba8 portalStone;
    mapnik::image_rgba8 stedding;
};

struct Assets {
    mapnik::image_rgba8 base;
    double dpi;
    std::unique_ptr<FontFace> font;
    Sprites sprites;
    Dataset dataset;
};

// Loads everything up front so a bad input fails the run before anything is written.
Assets loadAssets(const AssetPaths &paths);

std::vector<ColoredPolyline> nationBorders(const Dataset &ds, int width);
Annotations buildAnnotations(const Dataset &ds, const Sprites &sprites);

// borders (when enabled), then icons, then labels
mapnik::image_rgba8 renderMap(mapnik::image_rgba8 canvas, const Dataset &ds, const Sprites &sprites,
                              TextRenderer &text, double dpi, const RenderConfig &cfg);

struct OutputPlan {
    std::string basename;
    ExportOptions options;
};

struct ExportResult {
    std::string path;
    int width;
    int height;
    std::vector<std::string> tileOutputs;
};

ExportResult exportMap(const mapnik::image_rgba8 &canvas, const RenderConfig &cfg, const OutputPlan &plan);
}
