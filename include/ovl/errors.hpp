#pragma once
#include <stdexcept>
#include <string>

namespace ovl {
// missing or unreadable input file (base image, font, icon, dataset)
class AssetError : public std::runtime_error {
    public:
    AssetError(const std::string &path, const std::string &reason)
        : std::runtime_error(path + ": " + reason), mPath(path) {}
    const std::string &path() const { return mPath; }

    private:
    std::string mPath;
};

// structurally invalid dataset entry; where() names it, e.g. "steddings[3].coord"
class DatasetError : public std::runtime_error {
    public:
    DatasetError(const std::string &where, const std::string &reason)
        : std::runtime_error(where + ": " + reason), mWhere(where) {}
    const std::string &where() const { return mWhere; }

    private:
    std::string mWhere;
};

class ExportError : public std::runtime_error {
    public:
    explicit ExportError(const std::string &msg) : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error {
    public:
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};
}
