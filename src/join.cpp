#include <cstdio>
#include <iostream>
#include "cxxopts.hpp"
#include "boost/filesystem.hpp"
#include "spdlog/spdlog.h"
#include "mapnik/image_compositing.hpp"
#include "mapnik/image_util.hpp"
#include "ovl/cmd.hpp"
#include "ovl/encode.hpp"
#include "ovl/errors.hpp"
#include "ovl/image_io.hpp"

using namespace std;

namespace {
string joinTileName(int x, int y) {
    char name[64];
    snprintf(name, sizeof(name), "tile_%02d_%02d.jpg", x, y);
    return name;
}
}

int cmdJoin(int argc, char * argv[]) {
    cxxopts::Options cmd_options("JOIN", "Montage a grid of tile_XX_YY.jpg tiles into one image");
    cmd_options.add_options()
        ("v,verbose", "Verbose output")
        ("cmd", "Command to run", cxxopts::value<string>())
        ("tiles", "Directory holding the tiles", cxxopts::value<string>())
        ("cols", "Number of tile columns", cxxopts::value<int>())
        ("rows", "Number of tile rows", cxxopts::value<int>())
        ("tile-width", "Tile width (default: 256)", cxxopts::value<int>())
        ("tile-height", "Tile height (default: 256)", cxxopts::value<int>())
        ("out", "Output image, .jpg or .png (default: map.jpg)", cxxopts::value<string>())
        ("quality", "JPEG quality (default: 90)", cxxopts::value<int>())
      ;

    cmd_options.parse_positional({"cmd","tiles","cols","rows"});
    auto result = cmd_options.parse(argc, argv);
    if (result.count("verbose")) spdlog::set_level(spdlog::level::debug);
    if (!result.count("tiles") || !result.count("cols") || !result.count("rows")) {
        throw ovl::ConfigError("usage: overlay join <tiles_dir> <cols> <rows> [--out map.jpg]");
    }

    string tiles_dir = result["tiles"].as<string>();
    int cols = result["cols"].as<int>();
    int rows = result["rows"].as<int>();
    int tile_w = 256;
    int tile_h = 256;
    if (result.count("tile-width")) tile_w = result["tile-width"].as<int>();
    if (result.count("tile-height")) tile_h = result["tile-height"].as<int>();
    if (cols <= 0 || rows <= 0 || tile_w <= 0 || tile_h <= 0) {
        throw ovl::ConfigError("grid and tile dimensions must be positive");
    }
    string out = "map.jpg";
    if (result.count("out")) out = result["out"].as<string>();

    ovl::ExportOptions opts;
    string ext = boost::filesystem::path(out).extension().string();
    opts.format = ovl::parseFormat(ext.empty() ? ext : ext.substr(1));
    if (result.count("quality")) opts.quality = result["quality"].as<int>();
    ovl::validate(opts);

    mapnik::image_rgba8 canvas(cols * tile_w, rows * tile_h, true, true);
    mapnik::fill(canvas, mapnik::color(255, 255, 255));
    int missing = 0;
    for (int y = 0; y < rows; y++) {
        for (int x = 0; x < cols; x++) {
            auto path = boost::filesystem::path(tiles_dir) / joinTileName(x, y);
            if (!boost::filesystem::exists(path)) {
                missing++;
                continue;
            }
            auto tile = ovl::loadImage(path.string());
            mapnik::composite(canvas, tile, mapnik::src_over, 1.0f, x * tile_w, y * tile_h);
        }
    }
    if (missing) spdlog::warn("{} of {} tiles missing, left white", missing, cols * rows);

    mapnik::demultiply_alpha(canvas);
    ovl::saveImage(canvas, out, opts);
    cout << "[OK] Saved: " << out << " (" << canvas.width() << "x" << canvas.height() << ")" << endl;
    return 0;
}
