#pragma once

#include "geoscene/bounding_box.hpp"
#include "geoscene/raster_source.hpp"
#include "geoscene/spatial_index.hpp"
#include "geoscene/tile_catalog.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace geoscene {

// How one tile is chosen when several intersect a query. Results are never
// mosaicked.
enum class TileSelection {
    FirstHit,       // first hit of the index traversal
    NearestTime,    // acquisition time closest to the query's mid time
};

// How the query's x/y become a pixel window.
enum class WindowMode {
    PixelSpace,     // x/y are used directly as column/row coordinates
    Geotransform,   // x/y are world coordinates mapped through the tile's transform
};

struct Sample {
    Raster<int32_t> image;
    std::string path;
    double timestamp = 0.0;
    BoundingBox tile_bounds;
    PixelWindow window;
};

using TileIndex = SpatialTemporalIndex<std::size_t>;

class QueryResolver {
public:
    // index payloads are positions in records. Both must outlive the resolver.
    QueryResolver(const RasterSource& source, const std::vector<TileRecord>& records,
                  const TileIndex& index, TileSelection selection = TileSelection::FirstHit,
                  WindowMode mode = WindowMode::PixelSpace);

    // Throws OutOfRangeQuery (or NoTileError) when nothing can serve the query,
    // SourceReadError when the tile cannot be read.
    Sample resolve(const BoundingBox& query) const;

    const TileRecord& select(const BoundingBox& query) const;

    // Window of query on a raster described by meta, clipped to its grid.
    static PixelWindow compute_window(const BoundingBox& query, WindowMode mode,
                                      const GeoMetadata& meta);

    TileSelection selection() const { return selection_; }
    WindowMode window_mode() const { return mode_; }

private:
    const RasterSource& source_;
    const std::vector<TileRecord>& records_;
    const TileIndex& index_;
    TileSelection selection_;
    WindowMode mode_;
};

} // namespace geoscene
