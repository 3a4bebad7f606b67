#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <jpeglib.h>
#include "mapnik/image_util.hpp"
#include "mapnik/image_scaling.hpp"
#include "ovl/encode.hpp"
#include "ovl/errors.hpp"

using namespace std;

namespace ovl {
namespace {
void onJpegError(j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    throw ExportError(string("JPEG encoder: ") + buffer);
}

template <typename T>
string encodeJpeg(const T &image, int quality) {
    jpeg_compress_struct cinfo;
    jpeg_error_mgr jerr;
    cinfo.err = jpeg_std_error(&jerr);
    jerr.error_exit = onJpegError;

    unsigned char *buffer = nullptr;
    unsigned long size = 0;
    jpeg_create_compress(&cinfo);
    struct Guard {
        jpeg_compress_struct *cinfo;
        unsigned char **buffer;
        ~Guard() {
            jpeg_destroy_compress(cinfo);
            free(*buffer);
        }
    } guard{&cinfo, &buffer};

    jpeg_mem_dest(&cinfo, &buffer, &size);
    cinfo.image_width = image.width();
    cinfo.image_height = image.height();
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    // no chroma subsampling
    for (int i = 0; i < cinfo.num_components; i++) {
        cinfo.comp_info[i].h_samp_factor = 1;
        cinfo.comp_info[i].v_samp_factor = 1;
    }
    cinfo.optimize_coding = FALSE;
    jpeg_start_compress(&cinfo, TRUE);

    vector<JSAMPLE> row(static_cast<size_t>(image.width()) * 3);
    while (cinfo.next_scanline < cinfo.image_height) {
        const uint8_t *src = reinterpret_cast<const uint8_t *>(image.get_row(cinfo.next_scanline));
        for (size_t x = 0; x < image.width(); x++) {
            row[x * 3] = src[x * 4];
            row[x * 3 + 1] = src[x * 4 + 1];
            row[x * 3 + 2] = src[x * 4 + 2];
        }
        JSAMPROW rows[1] = {row.data()};
        jpeg_write_scanlines(&cinfo, rows, 1);
    }
    jpeg_finish_compress(&cinfo);
    return string(reinterpret_cast<const char *>(buffer), size);
}
}

template <typename T>
string encodeImage(const T &image, const ExportOptions &opts) {
    if (image.width() == 0 || image.height() == 0) throw ExportError("cannot encode an empty image");
    if (opts.format == OutputFormat::Jpeg) return encodeJpeg(image, opts.quality);
    try {
        return mapnik::save_to_string(image, "png32");
    } catch (const mapnik::ImageWriterException &e) {
        throw ExportError(string("PNG encoder: ") + e.what());
    }
}

void writeFile(const string &path, const string &bytes) {
    ofstream out(path, ios_base::out | ios_base::binary | ios_base::trunc);
    if (!out) throw ExportError("cannot open " + path + " for writing");
    out.write(bytes.data(), bytes.size());
    out.close();
    if (!out) throw ExportError("failed writing " + path);
}

template <typename T>
void saveImage(const T &image, const string &path, const ExportOptions &opts) {
    writeFile(path, encodeImage(image, opts));
}

mapnik::image_rgba8 prepareForExport(const mapnik::image_rgba8 &canvas, double scale) {
    mapnik::image_rgba8 out(canvas);
    if (scale != 1.0) {
        double sw = canvas.width() * scale;
        double sh = canvas.height() * scale;
        if (!(sw > 0 && sh > 0 && sw <= kMaxImageSide && sh <= kMaxImageSide)) {
            throw ExportError("cannot scale a " + to_string(canvas.width()) + "x" + to_string(canvas.height()) +
                              " image by " + to_string(scale) + ", the result must be 1.." + to_string(kMaxImageSide) +
                              " pixels per side");
        }
        int w = max(1, static_cast<int>(lround(sw)));
        int h = max(1, static_cast<int>(lround(sh)));
        mapnik::image_rgba8 scaled(w, h, true, true);
        mapnik::scale_image_agg(scaled, canvas, mapnik::SCALING_LANCZOS,
                                static_cast<double>(w) / canvas.width(),
                                static_cast<double>(h) / canvas.height(),
                                0.0, 0.0, 1.0);
        out = move(scaled);
    }
    mapnik::demultiply_alpha(out);
    return out;
}

template string encodeImage<mapnik::image_rgba8>(const mapnik::image_rgba8 &, const ExportOptions &);
template string encodeImage<mapnik::image_view_rgba8>(const mapnik::image_view_rgba8 &, const ExportOptions &);
template void saveImage<mapnik::image_rgba8>(const mapnik::image_rgba8 &, const string &, const ExportOptions &);
template void saveImage<mapnik::image_view_rgba8>(const mapnik::image_view_rgba8 &, const string &, const ExportOptions &);
}
