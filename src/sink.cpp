#include "boost/filesystem.hpp"
#include "ovl/errors.hpp"
#include "ovl/encode.hpp"
#include "ovl/sink.hpp"
#include "ovl/tile.hpp"

using namespace std;

namespace ovl {
unique_ptr<Sink> CreateSink(const string &s, const TileLayout &layout) {
    string base = layout.base;
    string ext = layout.ext;
    return make_unique<FileSink>(s, [base, ext](int col, int row) { return tileName(base, col, row, ext); });
}

FileSink::FileSink(const string& s, Namer namer) : mOutput(s), mNamer(move(namer)) {
    boost::system::error_code ec;
    boost::filesystem::create_directories(s, ec);
    if (ec) throw ExportError("cannot create tile directory " + s + ": " + ec.message());
}

void FileSink::writeTile(int col, int row, const string& buf) {
    boost::filesystem::path tile_path = boost::filesystem::path(mOutput) / mNamer(col, row);
    writeFile(tile_path.string(), buf);
}
}
