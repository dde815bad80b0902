#include <gtest/gtest.h>
#include "geoscene/geo_transform.hpp"
#include "geoscene/raster_source.hpp"

#include <stdexcept>

class GeoTransformTest : public ::testing::Test {
protected:
    std::array<double, 6> test_transform = {
        30.0,       // pixel_size_x
        0.0,
        500000.0,   // origin_x
        0.0,
        -30.0,      // pixel_size_y (negative)
        4200000.0   // origin_y
    };
};

TEST_F(GeoTransformTest, PixelSizes) {
    geoscene::GeoTransform geo(test_transform);

    EXPECT_DOUBLE_EQ(geo.pixel_size_x(), 30.0);
    EXPECT_DOUBLE_EQ(geo.pixel_size_y(), -30.0);
}

TEST_F(GeoTransformTest, WorldToPixelRoundTrip) {
    geoscene::GeoTransform geo(test_transform);

    auto [col, row] = geo.world_to_pixel(500300.0, 4199400.0);
    EXPECT_DOUBLE_EQ(col, 10.0);
    EXPECT_DOUBLE_EQ(row, 20.0);

    auto [x, y] = geo.pixel_to_world(col, row);
    EXPECT_DOUBLE_EQ(x, 500300.0);
    EXPECT_DOUBLE_EQ(y, 4199400.0);
}

TEST_F(GeoTransformTest, OriginMapping) {
    geoscene::GeoTransform geo(test_transform);

    auto [col, row] = geo.world_to_pixel(500000.0, 4200000.0);
    EXPECT_DOUBLE_EQ(col, 0.0);
    EXPECT_DOUBLE_EQ(row, 0.0);
}

TEST_F(GeoTransformTest, BoundsOfGrid) {
    geoscene::GeoTransform geo(test_transform);

    auto b = geo.bounds(100, 50);
    EXPECT_DOUBLE_EQ(b[0], 500000.0);
    EXPECT_DOUBLE_EQ(b[1], 503000.0);
    EXPECT_DOUBLE_EQ(b[2], 4198500.0);
    EXPECT_DOUBLE_EQ(b[3], 4200000.0);
}

TEST_F(GeoTransformTest, WindowForNorthUpRaster) {
    geoscene::GeoTransform geo(test_transform);

    // maxy maps to the top row
    auto w = geo.window_for(500300.0, 500900.0, 4198800.0, 4199400.0, 100, 100);
    EXPECT_EQ(w, (geoscene::PixelWindow{10, 20, 20, 20}));
}

TEST_F(GeoTransformTest, WindowCoversPartialPixels) {
    geoscene::GeoTransform geo(test_transform);

    auto w = geo.window_for(500015.0, 500045.0, 4199955.0, 4199985.0, 100, 100);
    EXPECT_EQ(w, (geoscene::PixelWindow{0, 0, 2, 2}));
}

TEST_F(GeoTransformTest, WindowClipsDistantCoordinatesToGrid) {
    geoscene::GeoTransform geo(test_transform);

    // Edges map to columns around +-1e11, far outside int range.
    auto w = geo.window_for(-3e12, 3e12, 4199700.0, 4200000.0, 100, 50);
    EXPECT_EQ(w, (geoscene::PixelWindow{0, 0, 100, 10}));
}

TEST_F(GeoTransformTest, WindowOutsideGridIsEmpty) {
    geoscene::GeoTransform geo(test_transform);

    auto w = geo.window_for(600000.0, 600300.0, 4199700.0, 4200000.0, 100, 50);
    EXPECT_TRUE(w.empty());
}

TEST(PixelWindowTest, CoveringClipsInDouble) {
    EXPECT_EQ(geoscene::PixelWindow::covering(-2e9, 2e9, 0.0, 10.0, 100, 100),
              (geoscene::PixelWindow{0, 0, 100, 10}));
    EXPECT_EQ(geoscene::PixelWindow::covering(90.5, 1e300, -1e300, 2.5, 100, 100),
              (geoscene::PixelWindow{90, 0, 10, 3}));
    EXPECT_TRUE(geoscene::PixelWindow::covering(100.0, 120.0, 0.0, 10.0, 100, 100).empty());
    EXPECT_TRUE(geoscene::PixelWindow::covering(-50.0, -1.0, 0.0, 10.0, 100, 100).empty());
}

TEST_F(GeoTransformTest, FromGdalReordersCoefficients) {
    double gdal[6] = {500000.0, 30.0, 0.0, 4200000.0, 0.0, -30.0};
    auto geo = geoscene::GeoTransform::from_gdal(gdal);

    EXPECT_EQ(geo.coefficients(), test_transform);
}

TEST_F(GeoTransformTest, RejectsDegenerateTransforms) {
    EXPECT_THROW(geoscene::GeoTransform({0.0, 0.0, 0.0, 0.0, -1.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(geoscene::GeoTransform({1.0, 0.5, 0.0, 0.0, -1.0, 0.0}), std::invalid_argument);
}
