#pragma once
#include <string>
#include <vector>
#include "mapnik/image.hpp"
#include "ovl/config.hpp"

namespace ovl {
class Sink;

struct TileRect {
    int col;
    int row;
    int x;
    int y;
    int width;
    int height;
};

// Row-major ceil(W/T) x ceil(H/T) grid; edge tiles are cropped, never padded.
std::vector<TileRect> tileGrid(int width, int height, int tile_size);

// Balanced grid: as many tiles as a tile_w x tile_h grid needs, but with the
// actual tile size shrunk to ceil(W/cols) x ceil(H/rows) so edge tiles are not slivers.
std::vector<TileRect> balancedGrid(int width, int height, int tile_w, int tile_h);

// "<base>_x<col:02>_y<row:02>.<ext>"
std::string tileName(const std::string &base, int col, int row, const std::string &ext);

std::string tileDirectory(const std::string &base, int tile_size);

// Encodes every cell of the grid with opts and hands it to the sink. image is straight alpha.
int exportTiles(const mapnik::image_rgba8 &image, const std::vector<TileRect> &grid, Sink &sink, const ExportOptions &opts);
}
