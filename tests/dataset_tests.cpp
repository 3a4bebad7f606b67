#include <doctest/doctest.h>

#include <fstream>

#include "helpers.hpp"
#include "ovl/dataset.hpp"
#include "ovl/errors.hpp"

using namespace ovl;

namespace {
std::string whereOf(const std::string &json_text)
{
    try {
        parseDataset(json_text);
    } catch (const DatasetError &e) {
        return e.where();
    }
    return "";
}
}

TEST_CASE("parseDataset: reads every category")
{
    auto ds = parseDataset(R"({
        "portal_stones": [{"coord": [10, 20]}, {"coord": [30.5, 40]}],
        "steddings": [{"coord": [100, 100], "label": "Stock"}],
        "rivers": [{"coord": [5, 6], "label": "Brandywine"}],
        "nations": [{"border": [[0, 0], [10, 0], [10, 10]], "color": "rgb(1,2,3)"}]
    })");

    REQUIRE(ds.portalStones.size() == 2);
    CHECK(ds.portalStones[1].coord.x == doctest::Approx(30.5));
    REQUIRE(ds.steddings.size() == 1);
    CHECK(ds.steddings[0].label == "Stock");
    CHECK(ds.steddings[0].coord.y == doctest::Approx(100));
    REQUIRE(ds.rivers.size() == 1);
    CHECK(ds.rivers[0].label == "Brandywine");
    REQUIRE(ds.nations.size() == 1);
    CHECK(ds.nations[0].border.size() == 3);
    CHECK(ds.nations[0].color == "rgb(1,2,3)");
}

TEST_CASE("parseDataset: missing categories are empty lists")
{
    auto ds = parseDataset("{}");
    CHECK(ds.portalStones.empty());
    CHECK(ds.steddings.empty());
    CHECK(ds.rivers.empty());
    CHECK(ds.nations.empty());

    ds = parseDataset(R"({"steddings": null, "rivers": []})");
    CHECK(ds.steddings.empty());
    CHECK(ds.rivers.empty());
}

TEST_CASE("parseDataset: optional fields default to empty")
{
    auto ds = parseDataset(R"({
        "steddings": [{"coord": [1, 2]}],
        "nations": [{"color": "blue"}, {"border": [[0, 0], [1, 1]], "color": 7}]
    })");
    CHECK(ds.steddings[0].label.empty());
    CHECK(ds.nations[0].border.empty());
    CHECK(ds.nations[1].color.empty());
}

TEST_CASE("parseDataset: malformed entries are reported by location")
{
    CHECK(whereOf(R"({"steddings": [{"coord": [1, 2]}, {"label": "x"}]})") == "steddings[1].coord");
    CHECK(whereOf(R"({"portal_stones": [{"coord": [1]}]})") == "portal_stones[0].coord");
    CHECK(whereOf(R"({"rivers": [{"coord": ["a", 2]}]})") == "rivers[0].coord");
    CHECK(whereOf(R"({"rivers": [{"coord": [1, 2], "label": 3}]})") == "rivers[0].label");
    CHECK(whereOf(R"({"rivers": [7]})") == "rivers[0]");
    CHECK(whereOf(R"({"nations": [{"border": [[0, 0], [1]]}]})") == "nations[0].border[1]");
    CHECK(whereOf(R"({"nations": [{"border": 5}]})") == "nations[0].border");
    CHECK(whereOf(R"({"steddings": {"coord": [1, 2]}})") == "steddings");
}

TEST_CASE("parseDataset: broken JSON is a DatasetError")
{
    CHECK_THROWS_AS(parseDataset("{\"steddings\": ["), DatasetError);
    CHECK_THROWS_AS(parseDataset("[1, 2]"), DatasetError);
    CHECK(whereOf("not json") == "dataset");
}

TEST_CASE("loadDataset: reads a file and reports a missing one as an asset error")
{
    testing::TempDir dir;
    std::string path = dir.file("poi.json");
    {
        std::ofstream out(path);
        out << R"({"rivers": [{"coord": [1, 2], "label": "Arinelle"}]})";
    }
    auto ds = loadDataset(path);
    REQUIRE(ds.rivers.size() == 1);
    CHECK(ds.rivers[0].label == "Arinelle");

    CHECK_THROWS_AS(loadDataset(dir.file("missing.json")), AssetError);
}
