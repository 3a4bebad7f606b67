#pragma once
#include <string>
#include <vector>
#include "mapnik/image.hpp"
#include "ovl/geometry.hpp"
#include "ovl/text.hpp"

namespace ovl {
// Placement constants tuned for one dataset and art style; they may have to become
// options if the tool is pointed at different maps.
constexpr int kSteddingLabelLift = 10;     // baseline sits this far above the icon's bottom edge
constexpr double kRiverLabelOffsetX = 50.0; // keeps river names off the river line
constexpr double kLabelPointSize = 14.0;
constexpr int kLabelStrokeWidth = 2;

enum class LabelStyle { Stedding, River };

TextStyle labelStyle(LabelStyle style, double dpi);

struct PixelPoint {
    int x;
    int y;
};

struct IconPlacement {
    Point2D center;
    const mapnik::image_rgba8 *sprite;
};

struct Label {
    Point2D position;
    std::string text;
    LabelStyle style;
    int iconHeight = 0; // height of the icon a stedding label hangs from
};

struct Annotations {
    std::vector<IconPlacement> icons;
    std::vector<Label> labels;
};

PixelPoint iconTopLeft(Point2D center, int width, int height);
PixelPoint steddingLabelOrigin(Point2D icon_center, int icon_height, const TextBox &box);
PixelPoint riverLabelOrigin(Point2D coord, const TextBox &box);

// alpha-over of a premultiplied sprite, centred on the point and clipped to the canvas
void placeIcon(mapnik::image_rgba8 &canvas, const mapnik::image_rgba8 &sprite, Point2D center);

class Compositor {
    public:
    Compositor(TextRenderer &text, double dpi);

    // icons first, in order, then labels on top of them
    mapnik::image_rgba8 apply(mapnik::image_rgba8 canvas, const Annotations &annotations);
    PixelPoint labelOrigin(const Label &label);

    private:
    TextRenderer &mText;
    TextStyle mSteddingStyle;
    TextStyle mRiverStyle;
};
}
