#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "boost/filesystem.hpp"
#include "mapnik/color.hpp"
#include "mapnik/image.hpp"
#include "mapnik/image_reader.hpp"
#include "mapnik/image_util.hpp"
#include "ovl/text.hpp"

namespace testing {
struct Rgba {
    int r;
    int g;
    int b;
    int a;
};

inline Rgba pixel(const mapnik::image_rgba8 &img, int x, int y) {
    const std::uint8_t *row = reinterpret_cast<const std::uint8_t *>(img.get_row(y));
    const std::uint8_t *p = row + x * 4;
    return {p[0], p[1], p[2], p[3]};
}

inline void setPixel(mapnik::image_rgba8 &img, int x, int y, Rgba c) {
    std::uint8_t *p = reinterpret_cast<std::uint8_t *>(img.get_row(y)) + x * 4;
    p[0] = static_cast<std::uint8_t>(c.r);
    p[1] = static_cast<std::uint8_t>(c.g);
    p[2] = static_cast<std::uint8_t>(c.b);
    p[3] = static_cast<std::uint8_t>(c.a);
}

// premultiplied canvas filled with c (c given straight)
inline mapnik::image_rgba8 solid(int w, int h, const mapnik::color &c) {
    mapnik::image_rgba8 img(w, h, true, true);
    mapnik::fill(img, c);
    return img;
}

inline mapnik::image_rgba8 transparent(int w, int h) {
    return mapnik::image_rgba8(w, h, true, true);
}

inline bool samePixels(const mapnik::image_rgba8 &a, const mapnik::image_rgba8 &b) {
    if (a.width() != b.width() || a.height() != b.height()) return false;
    for (std::size_t y = 0; y < a.height(); y++) {
        for (std::size_t x = 0; x < a.width(); x++) {
            if (a(x, y) != b(x, y)) return false;
        }
    }
    return true;
}

// decoded as stored, i.e. straight alpha
inline mapnik::image_rgba8 decode(const std::string &bytes) {
    std::unique_ptr<mapnik::image_reader> reader(mapnik::get_image_reader(bytes.data(), bytes.size()));
    if (!reader) throw std::runtime_error("no reader for encoded bytes");
    mapnik::image_rgba8 img(reader->width(), reader->height());
    reader->read(0, 0, img);
    return img;
}

// removed again when the test scope ends
class TempDir {
    public:
    TempDir() : mPath(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("overlay-test-%%%%-%%%%")) {
        boost::filesystem::create_directories(mPath);
    }
    ~TempDir() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(mPath, ec);
    }
    const boost::filesystem::path &path() const { return mPath; }
    std::string file(const std::string &name) const { return (mPath / name).string(); }

    private:
    boost::filesystem::path mPath;
};

struct DrawCall {
    int x;
    int y;
    std::string text;
    ovl::TextStyle style;
};

// Fixed-box text renderer so placement can be tested without a font file.
// draw() paints the box in the fill color so it shows up on the canvas.
class FakeText : public ovl::TextRenderer {
    public:
    explicit FakeText(ovl::TextBox box) : mBox(box) {}

    ovl::TextBox measure(const std::string &, const ovl::TextStyle &) override {
        return mBox;
    }

    void draw(mapnik::image_rgba8 &canvas, int x, int y, const std::string &text, const ovl::TextStyle &style) override {
        calls.push_back({x, y, text, style});
        std::vector<unsigned char> coverage(static_cast<std::size_t>(mBox.width()) * mBox.height(), 255);
        ovl::blendCoverage(canvas, x + mBox.left, y + mBox.top, mBox.width(), mBox.height(), coverage.data(), style.fill);
    }

    std::vector<DrawCall> calls;

    private:
    ovl::TextBox mBox;
};
}
