#include <algorithm>
#include <cstdint>
#include <memory>
#include <sstream>
#include "boost/filesystem.hpp"
#include "spdlog/spdlog.h"
#include "ovl/errors.hpp"
#include "ovl/text.hpp"
#include FT_GLYPH_H
#include "agg_basics.h"
#include "agg_rendering_buffer.h"
#include "agg_pixfmt_rgba.h"
#include "agg_renderer_base.h"

using namespace std;

namespace ovl {
namespace {
struct GlyphDeleter {
    void operator()(FT_Glyph g) const { FT_Done_Glyph(g); }
};
using GlyphPtr = unique_ptr<FT_GlyphRec, GlyphDeleter>;
}

FontFace::FontFace(const string &path) : mPath(path), mTranscoder("utf-8") {
    if (!boost::filesystem::exists(path)) throw AssetError(path, "file not found");
    if (FT_Init_FreeType(&mLibrary)) throw AssetError(path, "cannot initialise FreeType");
    if (FT_New_Face(mLibrary, path.c_str(), 0, &mFace)) {
        FT_Done_FreeType(mLibrary);
        throw AssetError(path, "not a readable font");
    }
    if (FT_Stroker_New(mLibrary, &mStroker)) {
        FT_Done_Face(mFace);
        FT_Done_FreeType(mLibrary);
        throw AssetError(path, "cannot create glyph stroker");
    }
    spdlog::debug("loaded font {} ({} {})", path, mFace->family_name ? mFace->family_name : "?",
                  mFace->style_name ? mFace->style_name : "");
}

FontFace::~FontFace() {
    FT_Stroker_Done(mStroker);
    FT_Done_Face(mFace);
    FT_Done_FreeType(mLibrary);
}

void FontFace::check(FT_Error err, const string &what) const {
    if (err) {
        ostringstream msg;
        msg << what << " failed (FreeType error " << err << ")";
        throw AssetError(mPath, msg.str());
    }
}

FontFace::TextRaster FontFace::rasterize(const string &text, int size_px, int stroke_width) {
    check(FT_Set_Pixel_Sizes(mFace, 0, max(1, size_px)), "FT_Set_Pixel_Sizes");
    FT_Stroker_Set(mStroker, stroke_width * 64, FT_STROKER_LINECAP_ROUND, FT_STROKER_LINEJOIN_ROUND, 0);

    TextRaster out;
    bool inked = false;
    auto append = [&](vector<GlyphBitmap> &dst, FT_Glyph glyph, FT_Vector origin) {
        FT_Glyph image = glyph;
        check(FT_Glyph_To_Bitmap(&image, FT_RENDER_MODE_NORMAL, &origin, 0), "FT_Glyph_To_Bitmap");
        GlyphPtr owned(image);
        FT_BitmapGlyph bitmap_glyph = reinterpret_cast<FT_BitmapGlyph>(image);
        const FT_Bitmap &bm = bitmap_glyph->bitmap;
        if (bm.width == 0 || bm.rows == 0) return;

        GlyphBitmap g;
        g.x = bitmap_glyph->left;
        g.y = -bitmap_glyph->top;
        g.width = bm.width;
        g.rows = bm.rows;
        g.coverage.resize(static_cast<size_t>(g.width) * g.rows);
        for (int r = 0; r < g.rows; r++) {
            const unsigned char *src = bm.pitch < 0
                ? bm.buffer + (g.rows - 1 - r) * -bm.pitch
                : bm.buffer + r * bm.pitch;
            copy(src, src + g.width, g.coverage.begin() + static_cast<size_t>(r) * g.width);
        }

        if (!inked) {
            out.box = {g.x, g.y, g.x + g.width, g.y + g.rows};
            inked = true;
        } else {
            out.box.left = min(out.box.left, g.x);
            out.box.top = min(out.box.top, g.y);
            out.box.right = max(out.box.right, g.x + g.width);
            out.box.bottom = max(out.box.bottom, g.y + g.rows);
        }
        dst.push_back(move(g));
    };

    mapnik::value_unicode_string ustr = mTranscoder.transcode(text.c_str());
    bool kerning = FT_HAS_KERNING(mFace);
    FT_Pos pen_x = 0;
    FT_UInt previous = 0;
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        FT_UInt index = FT_Get_Char_Index(mFace, ustr.char32At(i));
        if (kerning && previous && index) {
            FT_Vector delta;
            FT_Get_Kerning(mFace, previous, index, FT_KERNING_DEFAULT, &delta);
            pen_x += delta.x;
        }
        check(FT_Load_Glyph(mFace, index, FT_LOAD_DEFAULT | FT_LOAD_NO_BITMAP), "FT_Load_Glyph");

        FT_Glyph raw = nullptr;
        check(FT_Get_Glyph(mFace->glyph, &raw), "FT_Get_Glyph");
        GlyphPtr fill(raw);
        FT_Vector origin = {pen_x, 0};

        if (stroke_width > 0) {
            // strokes a copy; the fill glyph stays ours
            FT_Glyph stroked = fill.get();
            check(FT_Glyph_Stroke(&stroked, mStroker, 0), "FT_Glyph_Stroke");
            GlyphPtr outline(stroked);
            append(out.outline, outline.get(), origin);
        }
        append(out.fill, fill.get(), origin);

        pen_x += mFace->glyph->advance.x;
        previous = index;
    }
    return out;
}

TextBox FontFace::measure(const string &text, const TextStyle &style) {
    return rasterize(text, style.sizePx, style.strokeWidth).box;
}

void FontFace::draw(mapnik::image_rgba8 &canvas, int x, int y, const string &text, const TextStyle &style) {
    TextRaster raster = rasterize(text, style.sizePx, style.strokeWidth);
    for (const auto &g : raster.outline) {
        blendCoverage(canvas, x + g.x, y + g.y, g.width, g.rows, g.coverage.data(), style.stroke);
    }
    for (const auto &g : raster.fill) {
        blendCoverage(canvas, x + g.x, y + g.y, g.width, g.rows, g.coverage.data(), style.fill);
    }
}

void blendCoverage(mapnik::image_rgba8 &canvas, int x0, int y0, int width, int rows, const unsigned char *coverage, const mapnik::color &color) {
    agg::rendering_buffer buf(canvas.bytes(), canvas.width(), canvas.height(), canvas.row_size());
    agg::pixfmt_rgba32_pre pixf(buf);
    agg::renderer_base<agg::pixfmt_rgba32_pre> ren(pixf);

    agg::rgba8 fill(color.red(), color.green(), color.blue(), color.alpha());
    fill.premultiply();

    // hand over covered runs only, the way a scanline emits its spans
    for (int r = 0; r < rows; r++) {
        const unsigned char *row = coverage + static_cast<size_t>(r) * width;
        int c = 0;
        while (c < width) {
            if (row[c] == 0) {
                c++;
                continue;
            }
            int start = c;
            while (c < width && row[c] != 0) c++;
            ren.blend_solid_hspan(x0 + start, y0 + r, c - start, fill, row + start);
        }
    }
}
}
