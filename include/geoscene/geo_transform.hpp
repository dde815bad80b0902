#pragma once

#include <array>
#include <utility>

namespace geoscene {

struct PixelWindow;

// North-up affine transform in affine-package order:
// [pixel_w, 0, origin_x, 0, -pixel_h, origin_y]
class GeoTransform {
public:
    explicit GeoTransform(const std::array<double, 6>& transform);

    // Build from the GDAL ordering [origin_x, pixel_w, 0, origin_y, 0, -pixel_h].
    static GeoTransform from_gdal(const double* gdal_transform);

    std::pair<double, double> world_to_pixel(double x, double y) const;
    std::pair<double, double> pixel_to_world(double col, double row) const;

    // Pixel window of a width x height grid covering a world rectangle,
    // regardless of axis direction. Empty when they do not overlap.
    PixelWindow window_for(double minx, double maxx, double miny, double maxy,
                           int width, int height) const;

    // Spatial extent (minx, maxx, miny, maxy) of a width x height grid.
    std::array<double, 4> bounds(int width, int height) const;

    double pixel_size_x() const { return pixel_size_x_; }
    double pixel_size_y() const { return pixel_size_y_; }
    double origin_x() const { return origin_x_; }
    double origin_y() const { return origin_y_; }
    const std::array<double, 6>& coefficients() const { return transform_; }

private:
    std::array<double, 6> transform_;
    double pixel_size_x_;
    double pixel_size_y_;   // signed, negative for north-up rasters
    double origin_x_;
    double origin_y_;
};

} // namespace geoscene
