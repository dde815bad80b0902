#pragma once

#include "geoscene/errors.hpp"
#include "geoscene/raster_source.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace geoscene_test {

// In-memory tiles keyed by path. Sample value is tag * 1000000 + row * 1000 + col.
class FakeRasterSource : public geoscene::RasterSource {
public:
    struct Tile {
        geoscene::GeoMetadata meta;
        int tag;
    };

    void add(const std::string& path, double minx, double maxx, double miny, double maxy,
             int width, int height, int tag = 0) {
        geoscene::GeoMetadata meta;
        meta.dtype = "int32";
        meta.count = 1;
        meta.width = width;
        meta.height = height;
        meta.transform = {(maxx - minx) / width, 0.0, minx, 0.0, -(maxy - miny) / height, maxy};
        tiles_[path] = Tile{meta, tag};
    }

    void remove(const std::string& path) { tiles_.erase(path); }

    std::unique_ptr<geoscene::RasterDataset> open(const std::string& path) const override {
        ++opens_;
        auto it = tiles_.find(path);
        if (it == tiles_.end()) throw geoscene::SourceReadError(path, "no such tile");
        return std::make_unique<Dataset>(it->second);
    }

    std::string file_extension() const override { return ".TIF"; }

    int opens() const { return opens_; }

    static int32_t value(int tag, int row, int col) { return tag * 1000000 + row * 1000 + col; }

private:
    class Dataset : public geoscene::RasterDataset {
    public:
        explicit Dataset(Tile tile) : tile_(std::move(tile)) {}

        const geoscene::GeoMetadata& metadata() const override { return tile_.meta; }

        geoscene::Raster<int32_t> read_int32(int band, const geoscene::PixelWindow& w) const override {
            if (band != 1) throw geoscene::SourceReadError("fake", "bad band");
            geoscene::Raster<int32_t> out(w.width, w.height);
            for (int r = 0; r < w.height; r++)
                for (int c = 0; c < w.width; c++)
                    out.at(r, c) = value(tile_.tag, w.row_off + r, w.col_off + c);
            return out;
        }

    private:
        Tile tile_;
    };

    std::map<std::string, Tile> tiles_;
    mutable int opens_ = 0;
};

// Writes <base>.json and <base>.bin in the mmap layout with uint16 samples
// equal to band * 10000 + row * 100 + col.
inline void write_mmap_tile(const std::string& base, int width, int height, int bands,
                            double origin_x, double origin_y, double pixel = 30.0) {
    std::ofstream json(base + ".json");
    json << "{\n"
         << "  \"dtype\": \"uint16\",\n"
         << "  \"count\": " << bands << ",\n"
         << "  \"height\": " << height << ",\n"
         << "  \"width\": " << width << ",\n"
         << "  \"transform\": [" << pixel << ", 0.0, " << origin_x << ", 0.0, " << -pixel
         << ", " << origin_y << "],\n"
         << "  \"crs\": \"EPSG:32618\"\n"
         << "}\n";
    json.close();

    std::vector<uint16_t> data(static_cast<size_t>(bands) * width * height);
    for (int b = 0; b < bands; b++)
        for (int r = 0; r < height; r++)
            for (int c = 0; c < width; c++)
                data[(static_cast<size_t>(b) * height + r) * width + c] =
                    static_cast<uint16_t>(b * 10000 + r * 100 + c);

    std::ofstream bin(base + ".bin", std::ios::binary);
    bin.write(reinterpret_cast<const char*>(data.data()), data.size() * sizeof(uint16_t));
}

// Unique scratch directory removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() /
                ("geoscene_" + name + "_" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

    std::string touch(const std::string& relative) const {
        auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream(file.string()) << "";
        return file.string();
    }

private:
    std::filesystem::path path_;
};

} // namespace geoscene_test
