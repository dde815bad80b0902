#pragma once

#include "geoscene/bounding_box.hpp"

#include <stdexcept>
#include <string>

namespace geoscene {

// Query box does not intersect the dataset. Maps to IndexError in Python.
class OutOfRangeQuery : public std::out_of_range {
public:
    OutOfRangeQuery(const BoundingBox& query, const BoundingBox& bounds);
    // Dataset without any tiles.
    explicit OutOfRangeQuery(const BoundingBox& query);

    const BoundingBox& query() const { return query_; }
    const BoundingBox& bounds() const { return bounds_; }
    bool has_bounds() const { return has_bounds_; }

protected:
    OutOfRangeQuery(const std::string& what, const BoundingBox& query, const BoundingBox& bounds);

private:
    BoundingBox query_;
    BoundingBox bounds_;
    bool has_bounds_ = true;
};

// Query lies inside the dataset bounds but falls in a coverage gap.
class NoTileError : public OutOfRangeQuery {
public:
    NoTileError(const BoundingBox& query, const BoundingBox& bounds);
};

// A tile file could not be opened or read.
class SourceReadError : public std::runtime_error {
public:
    SourceReadError(const std::string& path, const std::string& reason);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace geoscene
