#include <algorithm>
#include <cctype>
#include <string>
#include "ovl/config.hpp"
#include "ovl/errors.hpp"

using namespace std;

namespace ovl {
OutputFormat parseFormat(const string &s) {
    string lower(s);
    transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return tolower(c); });
    if (lower == "png") return OutputFormat::Png;
    if (lower == "jpg" || lower == "jpeg") return OutputFormat::Jpeg;
    throw ConfigError("unsupported output format '" + s + "' (expected jpg or png)");
}

string extension(OutputFormat format) {
    return format == OutputFormat::Png ? "png" : "jpg";
}

void validate(const RenderConfig &cfg) {
    if (!(cfg.outputScale > 0) || !(cfg.outputScale <= kMaxOutputScale)) {
        throw ConfigError("--scale must be a positive number no larger than " + to_string(static_cast<int>(kMaxOutputScale)));
    }
    if (cfg.supersampleFactor < 1 || cfg.supersampleFactor > kMaxSupersample) {
        throw ConfigError("--aa-scale must be between 1 and " + to_string(kMaxSupersample));
    }
    if (cfg.splineSamplesPerSegment < 1 || cfg.splineSamplesPerSegment > kMaxSplineSamples) {
        throw ConfigError("--spline-samples must be between 1 and " + to_string(kMaxSplineSamples));
    }
    if (cfg.borderWidthPx < 1 || cfg.borderWidthPx > kMaxBorderWidth) {
        throw ConfigError("--border-width must be between 1 and " + to_string(kMaxBorderWidth));
    }
    if (cfg.tileSizePx < 0) throw ConfigError("--tile-size must not be negative");
}

void validate(const ExportOptions &opts) {
    if (opts.quality < 1 || opts.quality > 100) throw ConfigError("--quality must be between 1 and 100");
}
}
