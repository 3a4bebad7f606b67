#pragma once
#include <string>

namespace ovl {
constexpr double kMaxOutputScale = 64.0;
constexpr int kMaxSupersample = 16;
constexpr int kMaxSplineSamples = 1000;
constexpr int kMaxBorderWidth = 1000;
// mapnik refuses to allocate images wider or taller than this
constexpr int kMaxImageSide = 65535;

enum class OutputFormat { Png, Jpeg };

// "png" or "jpg"/"jpeg"; anything else is a ConfigError
OutputFormat parseFormat(const std::string &s);
std::string extension(OutputFormat format);

struct ExportOptions {
    OutputFormat format = OutputFormat::Jpeg;
    int quality = 90;
};

struct RenderConfig {
    double outputScale = 1.0;
    int supersampleFactor = 1;
    int splineSamplesPerSegment = 10;
    int borderWidthPx = 5;
    int tileSizePx = 0; // 0 disables tiling
    bool drawBorders = false;
};

void validate(const RenderConfig &cfg);
void validate(const ExportOptions &opts);
}
