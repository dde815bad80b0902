#include "geoscene/bounding_box.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace geoscene {

BoundingBox::BoundingBox(double minx, double maxx, double miny, double maxy, double mint, double maxt)
    : minx(minx), maxx(maxx), miny(miny), maxy(maxy), mint(mint), maxt(maxt) {
    if (!(minx <= maxx) || !(miny <= maxy) || !(mint <= maxt)) {
        std::ostringstream msg;
        msg << "Invalid bounding box " << *this << ": min must not exceed max";
        throw std::invalid_argument(msg.str());
    }
}

bool BoundingBox::intersects(const BoundingBox& other) const {
    return minx <= other.maxx && maxx >= other.minx &&
           miny <= other.maxy && maxy >= other.miny &&
           mint <= other.maxt && maxt >= other.mint;
}

bool BoundingBox::contains(const BoundingBox& other) const {
    return minx <= other.minx && other.maxx <= maxx &&
           miny <= other.miny && other.maxy <= maxy &&
           mint <= other.mint && other.maxt <= maxt;
}

BoundingBox BoundingBox::extend(const BoundingBox& other) const {
    return BoundingBox(std::min(minx, other.minx), std::max(maxx, other.maxx),
                       std::min(miny, other.miny), std::max(maxy, other.maxy),
                       std::min(mint, other.mint), std::max(maxt, other.maxt));
}

bool operator==(const BoundingBox& a, const BoundingBox& b) {
    return a.minx == b.minx && a.maxx == b.maxx &&
           a.miny == b.miny && a.maxy == b.maxy &&
           a.mint == b.mint && a.maxt == b.maxt;
}

bool operator!=(const BoundingBox& a, const BoundingBox& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const BoundingBox& box) {
    return os << "BoundingBox(minx=" << box.minx << ", maxx=" << box.maxx
              << ", miny=" << box.miny << ", maxy=" << box.maxy
              << ", mint=" << box.mint << ", maxt=" << box.maxt << ")";
}

std::string to_string(const BoundingBox& box) {
    std::ostringstream os;
    os << box;
    return os.str();
}

} // namespace geoscene
