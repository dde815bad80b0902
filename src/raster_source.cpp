#include "geoscene/raster_source.hpp"
#include "geoscene/geo_transform.hpp"

#include <cmath>

namespace geoscene {

PixelWindow PixelWindow::covering(double col0, double col1, double row0, double row1,
                                  int raster_width, int raster_height) {
    double x0 = std::fmax(std::floor(std::fmin(col0, col1)), 0.0);
    double x1 = std::fmin(std::ceil(std::fmax(col0, col1)), raster_width);
    double y0 = std::fmax(std::floor(std::fmin(row0, row1)), 0.0);
    double y1 = std::fmin(std::ceil(std::fmax(row0, row1)), raster_height);
    if (!(x1 > x0) || !(y1 > y0)) return PixelWindow{};

    int col = static_cast<int>(x0);
    int row = static_cast<int>(y0);
    return PixelWindow{col, row, static_cast<int>(x1) - col, static_cast<int>(y1) - row};
}

bool operator==(const PixelWindow& a, const PixelWindow& b) {
    return a.col_off == b.col_off && a.row_off == b.row_off &&
           a.width == b.width && a.height == b.height;
}

size_t GeoMetadata::pixel_size() const {
    if (dtype == "uint8" || dtype == "int8") return 1;
    if (dtype == "uint16" || dtype == "int16") return 2;
    if (dtype == "uint32" || dtype == "int32" || dtype == "float32") return 4;
    if (dtype == "float64") return 8;
    return 1;
}

size_t GeoMetadata::total_bytes() const {
    return static_cast<size_t>(count) * height * width * pixel_size();
}

BoundingBox RasterDataset::bounds() const {
    const auto& meta = metadata();
    auto b = GeoTransform(meta.transform).bounds(meta.width, meta.height);
    return BoundingBox(b[0], b[1], b[2], b[3], 0.0, 0.0);
}

} // namespace geoscene
