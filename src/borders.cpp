#include <algorithm>
#include <limits>
#include <string>
#include "spdlog/spdlog.h"
#include "mapnik/image_compositing.hpp"
#include "mapnik/image_scaling.hpp"
#include "agg_basics.h"
#include "agg_rendering_buffer.h"
#include "agg_pixfmt_rgba.h"
#include "agg_renderer_base.h"
#include "agg_rasterizer_scanline_aa.h"
#include "agg_scanline_bin.h"
#include "agg_path_storage.h"
#include "agg_conv_stroke.h"
#include "agg_gamma_functions.h"
#include "ovl/borders.hpp"
#include "ovl/config.hpp"
#include "ovl/errors.hpp"
#include "ovl/spline.hpp"

using namespace std;

namespace ovl {
void strokePolyline(mapnik::image_rgba8 &layer, const vector<Point2D> &points, const mapnik::color &color, double width) {
    if (points.size() < 2) return;

    agg::rendering_buffer buf(layer.bytes(), layer.width(), layer.height(), layer.row_size());
    agg::pixfmt_rgba32_pre pixf(buf);
    agg::renderer_base<agg::pixfmt_rgba32_pre> ren(pixf);

    agg::path_storage path;
    path.move_to(points[0].x, points[0].y);
    for (size_t i = 1; i < points.size(); i++) {
        path.line_to(points[i].x, points[i].y);
    }

    agg::conv_stroke<agg::path_storage> stroke(path);
    stroke.width(width);
    stroke.line_join(agg::round_join);
    stroke.line_cap(agg::butt_cap);

    agg::rasterizer_scanline_aa<> ras;
    ras.clip_box(0, 0, layer.width(), layer.height());
    ras.gamma(agg::gamma_threshold(0.5));
    ras.add_path(stroke);

    agg::rgba8 fill(color.red(), color.green(), color.blue(), color.alpha());
    fill.premultiply();

    agg::scanline_bin sl;
    if (!ras.rewind_scanlines()) return;
    sl.reset(ras.min_x(), ras.max_x());
    while (ras.sweep_scanline(sl)) {
        int y = sl.y();
        auto span = sl.begin();
        for (unsigned n = sl.num_spans(); n > 0; --n, ++span) {
            int len = span->len < 0 ? -span->len : span->len;
            ren.copy_hline(span->x, y, span->x + len - 1, fill);
        }
    }
}

mapnik::image_rgba8 renderBorders(mapnik::image_rgba8 canvas, const vector<ColoredPolyline> &borders, const BorderOptions &opts) {
    int aa = max(1, opts.supersample);
    int w = canvas.width();
    int h = canvas.height();
    if (static_cast<long long>(max(w, h)) * aa > kMaxImageSide) {
        throw ConfigError("a " + to_string(w) + "x" + to_string(h) + " map supersampled " + to_string(aa) +
                          " times exceeds " + to_string(kMaxImageSide) + " pixels per side, lower --aa-scale");
    }
    if (static_cast<long long>(opts.samplesPerSegment) * aa > numeric_limits<int>::max()) {
        throw ConfigError("--spline-samples is too large for --aa-scale " + to_string(aa));
    }
    int samples = max(kMinSamplesPerSegment, opts.samplesPerSegment * aa);

    mapnik::image_rgba8 layer(w * aa, h * aa, true, true);
    int drawn = 0;
    for (const auto &border : borders) {
        if (border.points.size() < 2) continue;
        // pixel centres of the canvas land on pixel centres of the layer
        vector<Point2D> pts;
        pts.reserve(border.points.size());
        for (const auto &p : border.points) {
            pts.push_back({(p.x + 0.5) * aa, (p.y + 0.5) * aa});
        }
        strokePolyline(layer, catmullRom(pts, samples, border.closed), border.color, border.width * aa);
        drawn++;
    }
    spdlog::debug("stroked {} of {} borders on a {}x{} layer", drawn, borders.size(), layer.width(), layer.height());
    if (drawn == 0) return canvas;

    if (aa > 1) {
        mapnik::image_rgba8 scaled(w, h, true, true);
        mapnik::scale_image_agg(scaled, layer, mapnik::SCALING_LANCZOS,
                                static_cast<double>(w) / layer.width(),
                                static_cast<double>(h) / layer.height(),
                                0.0, 0.0, 1.0);
        layer = move(scaled);
    }
    mapnik::composite(canvas, layer, mapnik::src_over);
    return canvas;
}
}
