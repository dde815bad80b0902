#pragma once

#include "geoscene/raster_source.hpp"

#include <cstdint>
#include <cstddef>
#include <string>
#include <memory>
#include <stdexcept>

namespace geoscene {

struct WindowView {
    const uint8_t* data;
    int bands;
    int height;
    int width;
    size_t stride_band;
    size_t stride_row;
    size_t pixel_size;

    template<typename T>
    T at(int b, int y, int x) const {
        return *reinterpret_cast<const T*>(data + b * stride_band + y * stride_row + x * pixel_size);
    }
};

// Memory-mapped raw raster: <base>.json metadata next to a band-sequential <base>.bin.
class MMapReader {
public:
    explicit MMapReader(const std::string& base_path);
    ~MMapReader();

    MMapReader(const MMapReader&) = delete;
    MMapReader& operator=(const MMapReader&) = delete;
    MMapReader(MMapReader&&) noexcept;
    MMapReader& operator=(MMapReader&&) noexcept;

    WindowView get_window(int x, int y, int width, int height) const;
    bool is_valid_window(int x, int y, int width, int height) const;

    // Copy one band (0-based) of a window, casting each sample to int32.
    Raster<int32_t> read_int32(int band, int x, int y, int width, int height) const;

    const GeoMetadata& metadata() const { return meta_; }
    int width() const { return meta_.width; }
    int height() const { return meta_.height; }
    int bands() const { return meta_.count; }

private:
    void release();

    GeoMetadata meta_;
    void* mapped_data_ = nullptr;
    size_t mapped_size_ = 0;
    int fd_ = -1;
};

// RasterSource over the mmap layout. Tile paths name the .json sidecar.
class MMapRasterSource : public RasterSource {
public:
    std::unique_ptr<RasterDataset> open(const std::string& path) const override;
    std::string file_extension() const override { return ".json"; }
};

} // namespace geoscene
