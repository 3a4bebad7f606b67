#pragma once
#include <string>
#include <vector>
#include "ovl/geometry.hpp"

namespace ovl {
struct PortalStone {
    Point2D coord;
};

struct NamedPlace {
    Point2D coord;
    std::string label;
};

struct Nation {
    std::vector<Point2D> border;
    std::string color;
};

// Every key is optional; a missing key is an empty list. Malformed entries
// (missing coord, wrong types) raise DatasetError naming the entry.
struct Dataset {
    std::vector<PortalStone> portalStones;
    std::vector<NamedPlace> steddings;
    std::vector<NamedPlace> rivers;
    std::vector<Nation> nations;
};

Dataset parseDataset(const std::string &json_text);
Dataset loadDataset(const std::string &path);
}
