#pragma once

#include "geoscene/bounding_box.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/index/rtree.hpp>

#include <cstddef>
#include <optional>
#include <utility>

namespace geoscene {

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// 3-D (x, y, time) R-tree over payloads of type T. No duplicate
// suppression and no removal; the index is read-only once built.
template<typename T>
class SpatialTemporalIndex {
public:
    using point_t = bg::model::point<double, 3, bg::cs::cartesian>;
    using box_t = bg::model::box<point_t>;
    using value_t = std::pair<box_t, T>;
    using params_t = bgi::linear<32, 8>;
    using rtree_t = bgi::rtree<value_t, params_t>;
    using query_iterator = typename rtree_t::const_query_iterator;

    class Hit {
    public:
        explicit Hit(const value_t& value) : value_(&value) {}

        BoundingBox bbox() const { return to_bbox(value_->first); }
        const T& payload() const { return value_->second; }

    private:
        const value_t* value_;
    };

    // Lazy range over the stored values intersecting a query box.
    class Hits {
    public:
        class iterator {
        public:
            explicit iterator(query_iterator it) : it_(std::move(it)) {}

            Hit operator*() const { return Hit(*it_); }
            iterator& operator++() { ++it_; return *this; }
            bool operator==(const iterator& other) const { return it_ == other.it_; }
            bool operator!=(const iterator& other) const { return it_ != other.it_; }

        private:
            query_iterator it_;
        };

        Hits(const rtree_t& tree, const box_t& query) : tree_(&tree), query_(query) {}

        iterator begin() const { return iterator(tree_->qbegin(bgi::intersects(query_))); }
        iterator end() const { return iterator(tree_->qend()); }
        bool empty() const { return begin() == end(); }

    private:
        const rtree_t* tree_;
        box_t query_;
    };

    void insert(const BoundingBox& bbox, T payload) {
        tree_.insert(value_t(to_box(bbox), std::move(payload)));
        bounds_ = bounds_ ? bounds_->extend(bbox) : bbox;
    }

    // Every stored value whose box intersects `query`, touching included.
    Hits intersect(const BoundingBox& query) const {
        return Hits(tree_, to_box(query));
    }

    // Union of all inserted boxes; empty when nothing is indexed.
    const std::optional<BoundingBox>& bounds() const { return bounds_; }

    std::size_t size() const { return tree_.size(); }
    bool empty() const { return tree_.empty(); }

    static box_t to_box(const BoundingBox& b) {
        return box_t(point_t(b.minx, b.miny, b.mint), point_t(b.maxx, b.maxy, b.maxt));
    }

    static BoundingBox to_bbox(const box_t& box) {
        const auto& lo = box.min_corner();
        const auto& hi = box.max_corner();
        return BoundingBox(bg::get<0>(lo), bg::get<0>(hi),
                           bg::get<1>(lo), bg::get<1>(hi),
                           bg::get<2>(lo), bg::get<2>(hi));
    }

private:
    rtree_t tree_;
    std::optional<BoundingBox> bounds_;
};

} // namespace geoscene
