#include "geoscene/geo_transform.hpp"
#include "geoscene/raster_source.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace geoscene {

GeoTransform::GeoTransform(const std::array<double, 6>& transform)
    : transform_(transform)
    , pixel_size_x_(transform[0])
    , pixel_size_y_(transform[4])
    , origin_x_(transform[2])
    , origin_y_(transform[5]) {
    if (transform[1] != 0.0 || transform[3] != 0.0) {
        throw std::invalid_argument("Rotated geotransforms are not supported");
    }
    if (pixel_size_x_ == 0.0 || pixel_size_y_ == 0.0) {
        throw std::invalid_argument("Geotransform pixel size must be non-zero");
    }
}

GeoTransform GeoTransform::from_gdal(const double* gt) {
    return GeoTransform({gt[1], gt[2], gt[0], gt[4], gt[5], gt[3]});
}

std::pair<double, double> GeoTransform::world_to_pixel(double x, double y) const {
    return {(x - origin_x_) / pixel_size_x_, (y - origin_y_) / pixel_size_y_};
}

std::pair<double, double> GeoTransform::pixel_to_world(double col, double row) const {
    return {origin_x_ + col * pixel_size_x_, origin_y_ + row * pixel_size_y_};
}

PixelWindow GeoTransform::window_for(double minx, double maxx, double miny, double maxy,
                                     int width, int height) const {
    auto [c0, r0] = world_to_pixel(minx, miny);
    auto [c1, r1] = world_to_pixel(maxx, maxy);
    return PixelWindow::covering(c0, c1, r0, r1, width, height);
}

std::array<double, 4> GeoTransform::bounds(int width, int height) const {
    auto [x0, y0] = pixel_to_world(0, 0);
    auto [x1, y1] = pixel_to_world(width, height);
    return {std::min(x0, x1), std::max(x0, x1), std::min(y0, y1), std::max(y0, y1)};
}

} // namespace geoscene
