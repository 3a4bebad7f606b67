#include <iostream>
#include "cxxopts.hpp"
#include "boost/filesystem.hpp"
#include "spdlog/spdlog.h"
#include "ovl/cmd.hpp"
#include "ovl/pipeline.hpp"

using namespace std;

int cmdRender(int argc, char * argv[]) {
    cxxopts::Options cmd_options("RENDER", "Annotate a large map with POIs, labels and nation borders");
    cmd_options.add_options()
        ("v,verbose", "Verbose output")
        ("h,help", "Print usage")
        ("cmd", "Command to run", cxxopts::value<string>())
        ("assets-dir", "Directory containing the map, font, icons and dataset (default: .)", cxxopts::value<string>())
        ("map", "Map image filename (default: map.jpg)", cxxopts::value<string>())
        ("font", "Font filename (default: HyliaSerifBeta-Regular.otf)", cxxopts::value<string>())
        ("portal-icon", "Portal stone icon filename (default: portal_stone.png)", cxxopts::value<string>())
        ("stedding-icon", "Stedding icon filename (default: stedding.png)", cxxopts::value<string>())
        ("json", "POI dataset filename (default: poi.json)", cxxopts::value<string>())
        ("out", "Output basename without extension (default: map_annotated)", cxxopts::value<string>())
        ("format", "Output format jpg or png (default: jpg)", cxxopts::value<string>())
        ("quality", "JPEG quality (default: 90)", cxxopts::value<int>())
        ("scale", "Output downscale factor, e.g. 0.5 (default: 1)", cxxopts::value<double>())
        ("tile-size", "Also export tiles of this size, e.g. 4096 (default: 0, off)", cxxopts::value<int>())
        ("nation-borders", "Draw nation borders")
        ("spline-samples", "Samples per segment for border smoothing (default: 10)", cxxopts::value<int>())
        ("aa-scale", "Supersampling factor for borders, 1 = off (default: 1)", cxxopts::value<int>())
        ("border-width", "Border stroke width in pixels (default: 5)", cxxopts::value<int>())
      ;

    cmd_options.parse_positional({"cmd"});
    auto result = cmd_options.parse(argc, argv);
    if (result.count("help")) {
        cout << cmd_options.help() << endl;
        return 0;
    }
    if (result.count("verbose")) spdlog::set_level(spdlog::level::debug);

    string assets_dir = ".";
    if (result.count("assets-dir")) assets_dir = result["assets-dir"].as<string>();
    auto asset = [&](const char *key, const char *fallback) {
        string name = result.count(key) ? result[key].as<string>() : string(fallback);
        return (boost::filesystem::path(assets_dir) / name).string();
    };

    ovl::AssetPaths paths;
    paths.map = asset("map", "map.jpg");
    paths.font = asset("font", "HyliaSerifBeta-Regular.otf");
    paths.portalIcon = asset("portal-icon", "portal_stone.png");
    paths.steddingIcon = asset("stedding-icon", "stedding.png");
    paths.dataset = asset("json", "poi.json");

    ovl::RenderConfig cfg;
    if (result.count("scale")) cfg.outputScale = result["scale"].as<double>();
    if (result.count("aa-scale")) cfg.supersampleFactor = result["aa-scale"].as<int>();
    if (result.count("spline-samples")) cfg.splineSamplesPerSegment = result["spline-samples"].as<int>();
    if (result.count("border-width")) cfg.borderWidthPx = result["border-width"].as<int>();
    if (result.count("tile-size")) cfg.tileSizePx = result["tile-size"].as<int>();
    cfg.drawBorders = result.count("nation-borders") > 0;
    ovl::validate(cfg);

    ovl::OutputPlan plan;
    plan.basename = "map_annotated";
    if (result.count("out")) plan.basename = result["out"].as<string>();
    if (result.count("format")) plan.options.format = ovl::parseFormat(result["format"].as<string>());
    if (result.count("quality")) plan.options.quality = result["quality"].as<int>();
    ovl::validate(plan.options);

    ovl::Assets assets = ovl::loadAssets(paths);
    if (cfg.drawBorders) {
        spdlog::info("rendering borders at {}x supersampling", cfg.supersampleFactor);
    }
    auto canvas = ovl::renderMap(move(assets.base), assets.dataset, assets.sprites, *assets.font, assets.dpi, cfg);

    auto exported = ovl::exportMap(canvas, cfg, plan);
    cout << "[OK] Saved: " << exported.path << " (" << exported.width << "x" << exported.height << ")" << endl;
    for (const auto &dest : exported.tileOutputs) {
        cout << "[OK] Exported tiles to: " << dest << endl;
    }
    return 0;
}
