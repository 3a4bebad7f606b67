#include "spdlog/spdlog.h"
#include "mapnik/config_error.hpp"
#include "ovl/color.hpp"

using namespace std;

namespace ovl {
mapnik::color parseBorderColor(const string &css) {
    mapnik::color c(255, 0, 0);
    try {
        c = mapnik::color(css);
    } catch (const mapnik::config_error &e) {
        spdlog::debug("border color '{}' not understood ({}), using fallback red", css, e.what());
    }
    c.set_alpha(kBorderAlpha);
    return c;
}
}
