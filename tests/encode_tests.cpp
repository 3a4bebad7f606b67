#include <doctest/doctest.h>

#include <cstdint>
#include <cstdlib>
#include <vector>

#include "helpers.hpp"
#include "ovl/encode.hpp"
#include "ovl/errors.hpp"

using namespace ovl;
using testing::pixel;

namespace {
// sampling factor byte (h << 4 | v) of each component in the baseline frame header
std::vector<int> jpegSampling(const std::string &bytes)
{
    std::vector<int> factors;
    const auto *b = reinterpret_cast<const std::uint8_t *>(bytes.data());
    for (size_t i = 2; i + 9 < bytes.size(); i++) {
        if (b[i] == 0xFF && b[i + 1] == 0xC0) {
            int components = b[i + 9];
            for (int c = 0; c < components; c++) {
                factors.push_back(b[i + 10 + c * 3 + 1]);
            }
            break;
        }
    }
    return factors;
}

mapnik::image_rgba8 gradient(int w, int h, int alpha)
{
    mapnik::image_rgba8 img(w, h);
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) testing::setPixel(img, x, y, {(x * 255) / w, (y * 255) / h, 90, alpha});
    }
    return img;
}
}

TEST_CASE("encodeImage: JPEG is baseline 4:4:4 and drops alpha")
{
    auto img = gradient(32, 16, 100);
    auto bytes = encodeImage(img, ExportOptions{OutputFormat::Jpeg, 90});
    REQUIRE(bytes.size() > 4);
    CHECK(static_cast<std::uint8_t>(bytes[0]) == 0xFF);
    CHECK(static_cast<std::uint8_t>(bytes[1]) == 0xD8);

    auto factors = jpegSampling(bytes);
    REQUIRE(factors.size() == 3);
    for (int f : factors) CHECK(f == 0x11);

    auto decoded = testing::decode(bytes);
    CHECK(decoded.width() == 32);
    CHECK(decoded.height() == 16);
    CHECK(pixel(decoded, 5, 5).a == 255);
    CHECK(std::abs(pixel(decoded, 16, 8).r - 127) <= 8);
}

TEST_CASE("encodeImage: quality changes the JPEG size")
{
    auto img = gradient(64, 64, 255);
    auto low = encodeImage(img, ExportOptions{OutputFormat::Jpeg, 10});
    auto high = encodeImage(img, ExportOptions{OutputFormat::Jpeg, 100});
    CHECK(low.size() < high.size());
}

TEST_CASE("encodeImage: PNG keeps alpha")
{
    auto img = gradient(8, 8, 100);
    auto decoded = testing::decode(encodeImage(img, ExportOptions{OutputFormat::Png, 90}));
    REQUIRE(decoded.width() == 8);
    CHECK(pixel(decoded, 3, 3).a == 100);
    CHECK(pixel(decoded, 3, 3).b == 90);
}

TEST_CASE("encodeImage and saveImage report failures as ExportError")
{
    mapnik::image_rgba8 empty(0, 0);
    CHECK_THROWS_AS(encodeImage(empty, ExportOptions()), ExportError);

    testing::TempDir dir;
    auto img = gradient(4, 4, 255);
    CHECK_THROWS_AS(saveImage(img, dir.file("no/such/dir/map.jpg"), ExportOptions()), ExportError);

    auto ok = dir.file("map.png");
    saveImage(img, ok, ExportOptions{OutputFormat::Png, 90});
    CHECK(boost::filesystem::file_size(ok) > 0);
}

TEST_CASE("encodeImage: views encode just their window")
{
    auto img = gradient(20, 10, 255);
    mapnik::image_view_rgba8 view(5, 2, 6, 4, img);
    auto decoded = testing::decode(encodeImage(view, ExportOptions{OutputFormat::Png, 90}));
    CHECK(decoded.width() == 6);
    CHECK(decoded.height() == 4);
    CHECK(decoded(0, 0) == img(5, 2));
}

TEST_CASE("prepareForExport: demultiplies and scales a copy")
{
    auto canvas = testing::transparent(10, 6);
    for (int y = 0; y < 6; y++) {
        for (int x = 0; x < 10; x++) testing::setPixel(canvas, x, y, {50, 0, 0, 128});
    }

    auto same = prepareForExport(canvas, 1.0);
    CHECK(same.width() == 10);
    CHECK(same.height() == 6);
    CHECK(std::abs(pixel(same, 4, 4).r - 100) <= 1);
    CHECK(pixel(same, 4, 4).a == 128);
    CHECK(pixel(canvas, 4, 4).r == 50);

    auto half = prepareForExport(canvas, 0.5);
    CHECK(half.width() == 5);
    CHECK(half.height() == 3);

    auto tiny = prepareForExport(canvas, 0.01);
    CHECK(tiny.width() == 1);
    CHECK(tiny.height() == 1);

    auto big = prepareForExport(canvas, 1.5);
    CHECK(big.width() == 15);
    CHECK(big.height() == 9);
}

TEST_CASE("prepareForExport: a scaled size beyond the image limit is an export error")
{
    auto canvas = testing::transparent(10, 6);
    CHECK_THROWS_AS(prepareForExport(canvas, 1e10), ExportError);
    CHECK_THROWS_AS(prepareForExport(canvas, kMaxImageSide), ExportError);
    CHECK(prepareForExport(canvas, 100).width() == 1000);
}
