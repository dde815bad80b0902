#include "geoscene/errors.hpp"

namespace geoscene {

OutOfRangeQuery::OutOfRangeQuery(const BoundingBox& query, const BoundingBox& bounds)
    : OutOfRangeQuery("query: " + to_string(query) +
                      " is not within bounds of the index: " + to_string(bounds),
                      query, bounds) {}

OutOfRangeQuery::OutOfRangeQuery(const BoundingBox& query)
    : std::out_of_range("query: " + to_string(query) + " cannot be served by an empty index"),
      query_(query), has_bounds_(false) {}

OutOfRangeQuery::OutOfRangeQuery(const std::string& what, const BoundingBox& query,
                                 const BoundingBox& bounds)
    : std::out_of_range(what), query_(query), bounds_(bounds) {}

NoTileError::NoTileError(const BoundingBox& query, const BoundingBox& bounds)
    : OutOfRangeQuery("query: " + to_string(query) +
                      " does not intersect any tile within bounds: " + to_string(bounds),
                      query, bounds) {}

SourceReadError::SourceReadError(const std::string& path, const std::string& reason)
    : std::runtime_error("Cannot read " + path + ": " + reason), path_(path) {}

} // namespace geoscene
