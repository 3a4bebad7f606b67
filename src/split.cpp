#include <iostream>
#include <sstream>
#include "cxxopts.hpp"
#include "spdlog/spdlog.h"
#include "mapnik/image_util.hpp"
#include "ovl/cmd.hpp"
#include "ovl/errors.hpp"
#include "ovl/image_io.hpp"
#include "ovl/sink.hpp"
#include "ovl/tile.hpp"

using namespace std;

namespace {
pair<int,int> parseTileSize(const string &s) {
    istringstream in(s);
    int w = 0;
    int h = 0;
    char sep = 0;
    if (!(in >> w >> sep >> h) || (sep != 'x' && sep != 'X') || w <= 0 || h <= 0 || !in.eof()) {
        throw ovl::ConfigError("tile size must look like 500x500, got '" + s + "'");
    }
    return {w, h};
}
}

int cmdSplit(int argc, char * argv[]) {
    cxxopts::Options cmd_options("SPLIT", "Split an image into a balanced grid of JPEG tiles");
    cmd_options.add_options()
        ("v,verbose", "Verbose output")
        ("cmd", "Command to run", cxxopts::value<string>())
        ("image", "Image to split", cxxopts::value<string>())
        ("size", "Target tile size, e.g. 500x500", cxxopts::value<string>())
        ("out-dir", "Output directory (default: www/tiles)", cxxopts::value<string>())
        ("prefix", "Tile filename prefix (default: tile)", cxxopts::value<string>())
        ("quality", "JPEG quality (default: 95)", cxxopts::value<int>())
      ;

    cmd_options.parse_positional({"cmd","image","size"});
    auto result = cmd_options.parse(argc, argv);
    if (result.count("verbose")) spdlog::set_level(spdlog::level::debug);
    if (!result.count("image") || !result.count("size")) {
        throw ovl::ConfigError("usage: overlay split <image> <WxH> [--out-dir dir] [--prefix tile]");
    }

    auto target = parseTileSize(result["size"].as<string>());
    string out_dir = "www/tiles";
    if (result.count("out-dir")) out_dir = result["out-dir"].as<string>();
    string prefix = "tile";
    if (result.count("prefix")) prefix = result["prefix"].as<string>();
    ovl::ExportOptions opts{ovl::OutputFormat::Jpeg, 95};
    if (result.count("quality")) opts.quality = result["quality"].as<int>();
    ovl::validate(opts);

    auto img = ovl::loadImage(result["image"].as<string>());
    mapnik::demultiply_alpha(img);
    int w = img.width();
    int h = img.height();
    auto grid = ovl::balancedGrid(w, h, target.first, target.second);
    if (grid.empty()) throw ovl::AssetError(result["image"].as<string>(), "image is empty");
    int cols = grid.back().col + 1;
    int rows = grid.back().row + 1;

    cout << "Image size: " << w << "x" << h << endl;
    cout << "Target tile: " << target.first << "x" << target.second << endl;
    cout << "Tiles grid: " << cols << "x" << rows << " -> " << cols * rows << " tiles" << endl;
    cout << "Final tile size: " << grid.front().width << "x" << grid.front().height << endl;

    // split names are row first: <prefix>_<row>_<col>.jpg
    ovl::FileSink sink(out_dir, [prefix](int col, int row) {
        return prefix + "_" + to_string(row) + "_" + to_string(col) + ".jpg";
    });
    ovl::exportTiles(img, grid, sink, opts);
    sink.finish();
    return 0;
}
