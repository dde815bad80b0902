#include <gtest/gtest.h>
#include "geoscene/bounding_box.hpp"

#include <limits>
#include <stdexcept>

using geoscene::BoundingBox;

TEST(BoundingBoxTest, RejectsInvertedAxes) {
    EXPECT_THROW(BoundingBox(10, 0, 0, 10, 0, 0), std::invalid_argument);
    EXPECT_THROW(BoundingBox(0, 10, 10, 0, 0, 0), std::invalid_argument);
    EXPECT_THROW(BoundingBox(0, 10, 0, 10, 5, 1), std::invalid_argument);
    EXPECT_NO_THROW(BoundingBox(0, 0, 0, 0, 7, 7));
}

TEST(BoundingBoxTest, RejectsNaNEdges) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(BoundingBox(nan, 10, 0, 10, 0, 0), std::invalid_argument);
    EXPECT_THROW(BoundingBox(0, 10, 0, 10, 0, nan), std::invalid_argument);
}

TEST(BoundingBoxTest, IntersectsRequiresOverlapOnAllAxes) {
    BoundingBox a(0, 100, 0, 100, 1000, 1000);
    BoundingBox b(50, 150, 50, 150, 2000, 2000);

    // Overlap in space, disjoint in time.
    EXPECT_FALSE(a.intersects(b));
    EXPECT_TRUE(a.intersects(BoundingBox(60, 70, 60, 70, 500, 1500)));
    EXPECT_FALSE(a.intersects(BoundingBox(101, 120, 0, 100, 1000, 1000)));
}

TEST(BoundingBoxTest, TouchingBoxesIntersect) {
    BoundingBox a(0, 10, 0, 10, 0, 10);
    BoundingBox b(10, 20, 10, 20, 10, 20);
    EXPECT_TRUE(a.intersects(b));
    EXPECT_TRUE(b.intersects(a));
}

TEST(BoundingBoxTest, ExtendIsAxisWiseUnion) {
    BoundingBox a(0, 10, 5, 15, 100, 100);
    BoundingBox b(-5, 3, 8, 20, 50, 200);
    EXPECT_EQ(a.extend(b), BoundingBox(-5, 10, 5, 20, 50, 200));
    EXPECT_TRUE(a.extend(b).contains(a));
    EXPECT_TRUE(a.extend(b).contains(b));
}

TEST(BoundingBoxTest, PrintsAllFields) {
    EXPECT_EQ(geoscene::to_string(BoundingBox(1, 2, 3, 4, 5, 6)),
              "BoundingBox(minx=1, maxx=2, miny=3, maxy=4, mint=5, maxt=6)");
}
