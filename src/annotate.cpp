#include <cmath>
#include "spdlog/spdlog.h"
#include "mapnik/image_compositing.hpp"
#include "ovl/annotate.hpp"
#include "ovl/image_io.hpp"

using namespace std;

namespace ovl {
namespace {
// halves go to the even neighbour under the default rounding mode
int roundPx(double v) {
    return static_cast<int>(lrint(v));
}
}

TextStyle labelStyle(LabelStyle style, double dpi) {
    int size = pointsToPixels(kLabelPointSize, dpi);
    mapnik::color white(255, 255, 255);
    if (style == LabelStyle::Stedding) {
        return {size, mapnik::color(0, 100, 0), white, kLabelStrokeWidth};
    }
    return {size, mapnik::color(0, 90, 200), white, kLabelStrokeWidth};
}

PixelPoint iconTopLeft(Point2D center, int width, int height) {
    return {roundPx(center.x - width / 2.0), roundPx(center.y - height / 2.0)};
}

PixelPoint steddingLabelOrigin(Point2D icon_center, int icon_height, const TextBox &box) {
    int x = roundPx(icon_center.x - (box.left + box.right) / 2.0);
    int baseline = roundPx(icon_center.y + icon_height / 2.0) - kSteddingLabelLift;
    return {x, baseline};
}

PixelPoint riverLabelOrigin(Point2D coord, const TextBox &box) {
    double ax = coord.x + kRiverLabelOffsetX;
    double ay = coord.y;
    return {roundPx(ax - (box.left + box.right) / 2.0), roundPx(ay - (box.top + box.bottom) / 2.0)};
}

void placeIcon(mapnik::image_rgba8 &canvas, const mapnik::image_rgba8 &sprite, Point2D center) {
    PixelPoint tl = iconTopLeft(center, sprite.width(), sprite.height());
    mapnik::composite(canvas, sprite, mapnik::src_over, 1.0f, tl.x, tl.y);
}

Compositor::Compositor(TextRenderer &text, double dpi)
    : mText(text),
      mSteddingStyle(labelStyle(LabelStyle::Stedding, dpi)),
      mRiverStyle(labelStyle(LabelStyle::River, dpi)) {
    spdlog::debug("label size {}px at {} dpi", mSteddingStyle.sizePx, dpi);
}

PixelPoint Compositor::labelOrigin(const Label &label) {
    if (label.style == LabelStyle::Stedding) {
        TextBox box = mText.measure(label.text, mSteddingStyle);
        return steddingLabelOrigin(label.position, label.iconHeight, box);
    }
    TextBox box = mText.measure(label.text, mRiverStyle);
    return riverLabelOrigin(label.position, box);
}

mapnik::image_rgba8 Compositor::apply(mapnik::image_rgba8 canvas, const Annotations &annotations) {
    for (const auto &icon : annotations.icons) {
        placeIcon(canvas, *icon.sprite, icon.center);
    }
    for (const auto &label : annotations.labels) {
        if (label.text.empty()) continue;
        PixelPoint origin = labelOrigin(label);
        const TextStyle &style = label.style == LabelStyle::Stedding ? mSteddingStyle : mRiverStyle;
        mText.draw(canvas, origin.x, origin.y, label.text, style);
    }
    spdlog::debug("placed {} icons and {} labels", annotations.icons.size(), annotations.labels.size());
    return canvas;
}
}
