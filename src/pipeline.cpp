#include "boost/filesystem.hpp"
#include "spdlog/spdlog.h"
#include "ovl/borders.hpp"
#include "ovl/color.hpp"
#include "ovl/encode.hpp"
#include "ovl/image_io.hpp"
#include "ovl/pipeline.hpp"
#include "ovl/sink.hpp"
#include "ovl/tile.hpp"

using namespace std;

namespace ovl {
Assets loadAssets(const AssetPaths &paths) {
    Assets assets;
    assets.base = loadImage(paths.map);
    assets.dpi = kDefaultDpi;
    if (auto dpi = readDpi(paths.map)) {
        if (*dpi > 0) assets.dpi = *dpi;
    }
    assets.font = make_unique<FontFace>(paths.font);
    assets.sprites.portalStone = loadImage(paths.portalIcon);
    assets.sprites.stedding = loadImage(paths.steddingIcon);
    assets.dataset = loadDataset(paths.dataset);
    spdlog::info("base map {}x{} at {} dpi", assets.base.width(), assets.base.height(), assets.dpi);
    return assets;
}

vector<ColoredPolyline> nationBorders(const Dataset &ds, int width) {
    vector<ColoredPolyline> borders;
    for (const auto &nation : ds.nations) {
        if (nation.border.size() < 2) continue;
        borders.push_back({nation.border, parseBorderColor(nation.color), width});
    }
    return borders;
}

Annotations buildAnnotations(const Dataset &ds, const Sprites &sprites) {
    Annotations out;
    for (const auto &stone : ds.portalStones) {
        out.icons.push_back({stone.coord, &sprites.portalStone});
    }
    int stedding_h = sprites.stedding.height();
    for (const auto &stedding : ds.steddings) {
        out.icons.push_back({stedding.coord, &sprites.stedding});
        out.labels.push_back({stedding.coord, stedding.label, LabelStyle::Stedding, stedding_h});
    }
    for (const auto &river : ds.rivers) {
        out.labels.push_back({river.coord, river.label, LabelStyle::River});
    }
    return out;
}

mapnik::image_rgba8 renderMap(mapnik::image_rgba8 canvas, const Dataset &ds, const Sprites &sprites,
                              TextRenderer &text, double dpi, const RenderConfig &cfg) {
    if (cfg.drawBorders) {
        BorderOptions opts;
        opts.supersample = cfg.supersampleFactor;
        opts.samplesPerSegment = cfg.splineSamplesPerSegment;
        canvas = renderBorders(move(canvas), nationBorders(ds, cfg.borderWidthPx), opts);
    }
    Compositor compositor(text, dpi);
    return compositor.apply(move(canvas), buildAnnotations(ds, sprites));
}

ExportResult exportMap(const mapnik::image_rgba8 &canvas, const RenderConfig &cfg, const OutputPlan &plan) {
    mapnik::image_rgba8 out = prepareForExport(canvas, cfg.outputScale);
    string ext = extension(plan.options.format);

    ExportResult result;
    result.path = plan.basename + "." + ext;
    result.width = out.width();
    result.height = out.height();
    saveImage(out, result.path, plan.options);

    if (cfg.tileSizePx > 0) {
        auto grid = tileGrid(result.width, result.height, cfg.tileSizePx);
        // tiles carry the basename without any directory part
        TileLayout layout{boost::filesystem::path(plan.basename).filename().string(), ext};
        string dest = tileDirectory(plan.basename, cfg.tileSizePx);
        auto sink = CreateSink(dest, layout);
        exportTiles(out, grid, *sink, plan.options);
        sink->finish();
        result.tileOutputs.push_back(dest);
    }
    return result;
}
}
