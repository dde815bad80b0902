#pragma once

#include "geoscene/bounding_box.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace geoscene {

struct PixelWindow {
    int col_off = 0;
    int row_off = 0;
    int width = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }

    // Pixels of a raster_width x raster_height grid touched by the fractional
    // column range [col0, col1] and row range [row0, row1]. Clipping happens
    // in double, so edges far outside the int range are safe.
    static PixelWindow covering(double col0, double col1, double row0, double row1,
                                int raster_width, int raster_height);
};

bool operator==(const PixelWindow& a, const PixelWindow& b);

struct GeoMetadata {
    std::string dtype;
    int count = 0;      // bands
    int height = 0;
    int width = 0;
    std::array<double, 6> transform{};
    std::string crs;

    size_t pixel_size() const;
    size_t total_bytes() const;
};

// Sample conversion shared by all sources. Floats truncate toward zero,
// saturate at the int32 limits and map NaN to the int32 minimum. Integers
// wrap modulo 2^32.
template<typename T>
int32_t sample_to_int32(T value) {
    if constexpr (std::is_floating_point<T>::value) {
        if (std::isnan(value) || value < -2147483648.0) return std::numeric_limits<int32_t>::min();
        if (value >= 2147483648.0) return std::numeric_limits<int32_t>::max();
    }
    return static_cast<int32_t>(value);
}

// Row-major 2-D sample array.
template<typename T>
struct Raster {
    int width = 0;
    int height = 0;
    std::vector<T> data;

    Raster() = default;
    Raster(int width, int height) : width(width), height(height),
        data(static_cast<size_t>(width) * height) {}

    T& at(int row, int col) { return data[static_cast<size_t>(row) * width + col]; }
    const T& at(int row, int col) const { return data[static_cast<size_t>(row) * width + col]; }
};

// One open raster file. Closed on destruction.
class RasterDataset {
public:
    virtual ~RasterDataset() = default;

    virtual const GeoMetadata& metadata() const = 0;

    // Spatial extent only; mint and maxt are zero.
    virtual BoundingBox bounds() const;

    // band is 1-based. Samples are cast to int32.
    virtual Raster<int32_t> read_int32(int band, const PixelWindow& window) const = 0;
};

// Opens raster files of one on-disk format.
class RasterSource {
public:
    virtual ~RasterSource() = default;

    // Throws SourceReadError when the file is missing or corrupt.
    virtual std::unique_ptr<RasterDataset> open(const std::string& path) const = 0;

    // Extension carried by tile files of this format, e.g. ".TIF".
    virtual std::string file_extension() const = 0;
};

} // namespace geoscene
