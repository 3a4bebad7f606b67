#pragma once
#include <functional>
#include <memory>
#include <string>

namespace ovl {
class Sink {
    public:
    virtual void writeTile(int col, int row, const std::string& buf) = 0;
    // flush whatever the sink buffers; called once after the last tile
    virtual void finish() {};
    virtual std::string describe() const = 0;
    virtual ~Sink() {};
};

struct TileLayout {
    std::string base; // tile file prefix
    std::string ext;  // "png" or "jpg"
};

// directory sink named <base>_x<col>_y<row>.<ext>
std::unique_ptr<Sink> CreateSink(const std::string &s, const TileLayout &layout);

class FileSink : public Sink {
    public:
    using Namer = std::function<std::string(int col, int row)>;

    FileSink(const std::string &path, Namer namer);
    ~FileSink() {};
    void writeTile(int col, int row, const std::string& buf) override;
    std::string describe() const override { return mOutput; }

    private:
    std::string mOutput;
    Namer mNamer;
};
}
