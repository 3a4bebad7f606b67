#pragma once
#include <cstdint>
#include <string>
#include "mapnik/color.hpp"

namespace ovl {
// Border strokes are always drawn at 70% opacity, whatever alpha the dataset gives.
constexpr std::uint8_t kBorderAlpha = 179;

// Parse any CSS color mapnik understands ("rgb(r,g,b)", "rgba(...)", "#rrggbb", names)
// and force the alpha to kBorderAlpha. Unparseable input yields red, also at kBorderAlpha.
mapnik::color parseBorderColor(const std::string &css);
}
