#pragma once
#include <string>
#include <vector>
#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_STROKER_H
#include "mapnik/color.hpp"
#include "mapnik/image.hpp"
#include "mapnik/unicode.hpp"

namespace ovl {
// Ink extent of a laid-out string in pixels, relative to the pen origin on the
// baseline (y grows downward, so top is usually negative).
struct TextBox {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
};

struct TextStyle {
    int sizePx;
    mapnik::color fill;
    mapnik::color stroke;
    int strokeWidth;
};

class TextRenderer {
    public:
    // box includes the stroke outline, so centring accounts for it
    virtual TextBox measure(const std::string &text, const TextStyle &style) = 0;
    // (x, y) is the pen origin on the baseline; the stroke is drawn beneath the fill
    virtual void draw(mapnik::image_rgba8 &canvas, int x, int y, const std::string &text, const TextStyle &style) = 0;
    virtual ~TextRenderer() {};
};

class FontFace : public TextRenderer {
    public:
    explicit FontFace(const std::string &path);
    ~FontFace();
    FontFace(const FontFace &) = delete;
    FontFace &operator=(const FontFace &) = delete;

    TextBox measure(const std::string &text, const TextStyle &style) override;
    void draw(mapnik::image_rgba8 &canvas, int x, int y, const std::string &text, const TextStyle &style) override;

    private:
    struct GlyphBitmap {
        int x; // top-left relative to the pen origin
        int y;
        int width;
        int rows;
        std::vector<unsigned char> coverage;
    };

    struct TextRaster {
        std::vector<GlyphBitmap> fill;
        std::vector<GlyphBitmap> outline;
        TextBox box;
    };

    TextRaster rasterize(const std::string &text, int size_px, int stroke_width);
    void check(FT_Error err, const std::string &what) const;

    std::string mPath;
    FT_Library mLibrary = nullptr;
    FT_Face mFace = nullptr;
    FT_Stroker mStroker = nullptr;
    mapnik::transcoder mTranscoder;
};

// Source-over blend of an 8-bit coverage mask onto a premultiplied canvas.
void blendCoverage(mapnik::image_rgba8 &canvas, int x0, int y0, int width, int rows, const unsigned char *coverage, const mapnik::color &color);
}
