#include <cmath>
#include <cstdio>
#include <fstream>
#include <memory>
#include <png.h>
#include <jpeglib.h>
#include "boost/filesystem.hpp"
#include "spdlog/spdlog.h"
#include "mapnik/image_reader.hpp"
#include "mapnik/image_util.hpp"
#include "ovl/errors.hpp"
#include "ovl/image_io.hpp"

using namespace std;

namespace ovl {
namespace {
struct FileCloser {
    void operator()(FILE *f) const { fclose(f); }
};
using FilePtr = unique_ptr<FILE, FileCloser>;

FilePtr openForRead(const string &path) {
    FilePtr f(fopen(path.c_str(), "rb"));
    if (!f) throw AssetError(path, "cannot open for reading");
    return f;
}

void onPngError(png_structp, png_const_charp msg) {
    throw runtime_error(msg);
}

void onPngWarning(png_structp, png_const_charp) {
}

optional<double> pngDpi(const string &path) {
    auto f = openForRead(path);
    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, onPngError, onPngWarning);
    if (!png) throw AssetError(path, "png_create_read_struct failed");
    png_infop info = png_create_info_struct(png);
    struct Guard {
        png_structp *png;
        png_infop *info;
        ~Guard() { png_destroy_read_struct(png, info, nullptr); }
    } guard{&png, &info};
    if (!info) throw AssetError(path, "png_create_info_struct failed");

    png_uint_32 res_x = 0;
    png_uint_32 res_y = 0;
    int unit = 0;
    try {
        png_init_io(png, f.get());
        png_read_info(png, info);
        if (!png_get_pHYs(png, info, &res_x, &res_y, &unit)) return nullopt;
    } catch (const runtime_error &e) {
        throw AssetError(path, e.what());
    }
    if (unit != PNG_RESOLUTION_METER || res_x == 0) return nullopt;
    return res_x * 0.0254;
}

struct JpegErrorManager {
    jpeg_error_mgr pub;
};

void onJpegError(j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    throw runtime_error(buffer);
}

void onJpegMessage(j_common_ptr, int) {
}

optional<double> jpegDpi(const string &path) {
    auto f = openForRead(path);
    jpeg_decompress_struct cinfo;
    JpegErrorManager err;
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = onJpegError;
    err.pub.emit_message = onJpegMessage;
    jpeg_create_decompress(&cinfo);
    struct Guard {
        jpeg_decompress_struct *cinfo;
        ~Guard() { jpeg_destroy_decompress(cinfo); }
    } guard{&cinfo};

    try {
        jpeg_stdio_src(&cinfo, f.get());
        jpeg_read_header(&cinfo, TRUE);
    } catch (const runtime_error &e) {
        throw AssetError(path, e.what());
    }
    if (!cinfo.saw_JFIF_marker || cinfo.X_density == 0) return nullopt;
    if (cinfo.density_unit == 1) return static_cast<double>(cinfo.X_density);
    if (cinfo.density_unit == 2) return cinfo.X_density * 2.54;
    return nullopt;
}
}

mapnik::image_rgba8 loadImage(const string &path) {
    if (!boost::filesystem::exists(path)) throw AssetError(path, "file not found");

    unique_ptr<mapnik::image_reader> reader;
    try {
        reader.reset(mapnik::get_image_reader(path));
    } catch (const mapnik::image_reader_exception &e) {
        throw AssetError(path, e.what());
    }
    if (!reader) throw AssetError(path, "unsupported image format");

    mapnik::image_rgba8 img(reader->width(), reader->height());
    try {
        reader->read(0, 0, img);
    } catch (const mapnik::image_reader_exception &e) {
        throw AssetError(path, e.what());
    }
    mapnik::premultiply_alpha(img);
    spdlog::debug("loaded {} ({}x{})", path, img.width(), img.height());
    return img;
}

optional<double> readDpi(const string &path) {
    unsigned char magic[8] = {0};
    {
        ifstream in(path, ios_base::in | ios_base::binary);
        if (!in) throw AssetError(path, "cannot open for reading");
        in.read(reinterpret_cast<char *>(magic), sizeof(magic));
    }
    if (png_sig_cmp(magic, 0, sizeof(magic)) == 0) return pngDpi(path);
    if (magic[0] == 0xFF && magic[1] == 0xD8) return jpegDpi(path);
    return nullopt;
}

int pointsToPixels(double points, double dpi) {
    return static_cast<int>(lrint(points * dpi / 72.0));
}
}
