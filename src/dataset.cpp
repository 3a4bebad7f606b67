#include <fstream>
#include <sstream>
#include "nlohmann/json.hpp"
#include "boost/filesystem.hpp"
#include "spdlog/spdlog.h"
#include "ovl/dataset.hpp"
#include "ovl/errors.hpp"

using namespace std;
using json = nlohmann::json;

namespace ovl {
namespace {
string entryName(const string &key, size_t i) {
    return key + "[" + to_string(i) + "]";
}

Point2D readPoint(const json &j, const string &where) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_number() || !j[1].is_number()) {
        throw DatasetError(where, "expected [x, y]");
    }
    return {j[0].get<double>(), j[1].get<double>()};
}

Point2D readCoord(const json &entry, const string &where) {
    if (!entry.is_object()) throw DatasetError(where, "expected an object");
    if (!entry.contains("coord")) throw DatasetError(where + ".coord", "missing");
    return readPoint(entry["coord"], where + ".coord");
}

string readLabel(const json &entry, const string &where) {
    if (!entry.contains("label") || entry["label"].is_null()) return "";
    if (!entry["label"].is_string()) throw DatasetError(where + ".label", "expected a string");
    return entry["label"].get<string>();
}

const json *category(const json &root, const string &key) {
    if (!root.contains(key) || root[key].is_null()) return nullptr;
    if (!root[key].is_array()) throw DatasetError(key, "expected a list");
    return &root[key];
}
}

Dataset parseDataset(const string &json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error &e) {
        throw DatasetError("dataset", e.what());
    }
    if (!root.is_object()) throw DatasetError("dataset", "expected a JSON object");

    Dataset ds;
    if (auto list = category(root, "portal_stones")) {
        for (size_t i = 0; i < list->size(); i++) {
            ds.portalStones.push_back({readCoord((*list)[i], entryName("portal_stones", i))});
        }
    }
    if (auto list = category(root, "steddings")) {
        for (size_t i = 0; i < list->size(); i++) {
            string where = entryName("steddings", i);
            const json &entry = (*list)[i];
            Point2D coord = readCoord(entry, where);
            ds.steddings.push_back({coord, readLabel(entry, where)});
        }
    }
    if (auto list = category(root, "rivers")) {
        for (size_t i = 0; i < list->size(); i++) {
            string where = entryName("rivers", i);
            const json &entry = (*list)[i];
            Point2D coord = readCoord(entry, where);
            ds.rivers.push_back({coord, readLabel(entry, where)});
        }
    }
    if (auto list = category(root, "nations")) {
        for (size_t i = 0; i < list->size(); i++) {
            string where = entryName("nations", i);
            const json &entry = (*list)[i];
            if (!entry.is_object()) throw DatasetError(where, "expected an object");
            Nation nation;
            if (entry.contains("border") && !entry["border"].is_null()) {
                const json &border = entry["border"];
                if (!border.is_array()) throw DatasetError(where + ".border", "expected a list of [x, y]");
                for (size_t k = 0; k < border.size(); k++) {
                    nation.border.push_back(readPoint(border[k], where + ".border[" + to_string(k) + "]"));
                }
            }
            // a non-string color is left empty and falls back to red at render time
            if (entry.contains("color") && entry["color"].is_string()) {
                nation.color = entry["color"].get<string>();
            }
            ds.nations.push_back(move(nation));
        }
    }
    return ds;
}

Dataset loadDataset(const string &path) {
    if (!boost::filesystem::exists(path)) throw AssetError(path, "file not found");
    ifstream in(path, ios_base::in | ios_base::binary);
    if (!in) throw AssetError(path, "cannot open for reading");
    stringstream buffer;
    buffer << in.rdbuf();

    Dataset ds = parseDataset(buffer.str());
    spdlog::debug("{}: {} portal stones, {} steddings, {} rivers, {} nations", path,
                  ds.portalStones.size(), ds.steddings.size(), ds.rivers.size(), ds.nations.size());
    return ds;
}
}
