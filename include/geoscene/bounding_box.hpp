#pragma once

#include <ostream>
#include <string>

namespace geoscene {

// Axis-aligned box in (x, y, time). x/y are projected units, t is Unix seconds.
struct BoundingBox {
    double minx = 0.0;
    double maxx = 0.0;
    double miny = 0.0;
    double maxy = 0.0;
    double mint = 0.0;
    double maxt = 0.0;

    BoundingBox() = default;
    BoundingBox(double minx, double maxx, double miny, double maxy, double mint, double maxt);

    // Closed intervals on every axis, so touching boxes intersect.
    bool intersects(const BoundingBox& other) const;
    bool contains(const BoundingBox& other) const;

    // Smallest box containing both.
    BoundingBox extend(const BoundingBox& other) const;

    double mid_time() const { return mint + (maxt - mint) / 2; }
};

bool operator==(const BoundingBox& a, const BoundingBox& b);
bool operator!=(const BoundingBox& a, const BoundingBox& b);
std::ostream& operator<<(std::ostream& os, const BoundingBox& box);
std::string to_string(const BoundingBox& box);

} // namespace geoscene
