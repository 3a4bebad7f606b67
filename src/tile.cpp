#include <algorithm>
#include <iomanip>
#include <sstream>
#include "spdlog/spdlog.h"
#include "mapnik/image_view.hpp"
#include "ovl/encode.hpp"
#include "ovl/errors.hpp"
#include "ovl/sink.hpp"
#include "ovl/tile.hpp"

using namespace std;

namespace ovl {
namespace {
int ceilDiv(int a, int b) {
    return (a + b - 1) / b;
}

vector<TileRect> grid(int width, int height, int step_w, int step_h) {
    vector<TileRect> tiles;
    int cols = ceilDiv(width, step_w);
    int rows = ceilDiv(height, step_h);
    tiles.reserve(static_cast<size_t>(cols) * rows);
    for (int row = 0; row < rows; row++) {
        for (int col = 0; col < cols; col++) {
            int x = col * step_w;
            int y = row * step_h;
            tiles.push_back({col, row, x, y, min(step_w, width - x), min(step_h, height - y)});
        }
    }
    return tiles;
}
}

vector<TileRect> tileGrid(int width, int height, int tile_size) {
    if (tile_size <= 0) throw ConfigError("tile size must be positive");
    if (width <= 0 || height <= 0) return {};
    return grid(width, height, tile_size, tile_size);
}

vector<TileRect> balancedGrid(int width, int height, int tile_w, int tile_h) {
    if (tile_w <= 0 || tile_h <= 0) throw ConfigError("tile size must be positive");
    if (width <= 0 || height <= 0) return {};
    int cols = ceilDiv(width, tile_w);
    int rows = ceilDiv(height, tile_h);
    return grid(width, height, ceilDiv(width, cols), ceilDiv(height, rows));
}

string tileName(const string &base, int col, int row, const string &ext) {
    ostringstream name;
    name << base << "_x" << setw(2) << setfill('0') << col
         << "_y" << setw(2) << setfill('0') << row << "." << ext;
    return name.str();
}

string tileDirectory(const string &base, int tile_size) {
    return base + "_tiles_" + to_string(tile_size);
}

int exportTiles(const mapnik::image_rgba8 &image, const vector<TileRect> &grid, Sink &sink, const ExportOptions &opts) {
    int written = 0;
    for (const auto &t : grid) {
        mapnik::image_view_rgba8 cropped(t.x, t.y, t.width, t.height, image);
        sink.writeTile(t.col, t.row, encodeImage(cropped, opts));
        written++;
    }
    spdlog::debug("wrote {} tiles to {}", written, sink.describe());
    return written;
}
}
