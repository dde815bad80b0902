#include "geoscene/query_resolver.hpp"
#include "geoscene/errors.hpp"
#include "geoscene/geo_transform.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

namespace geoscene {

QueryResolver::QueryResolver(const RasterSource& source, const std::vector<TileRecord>& records,
                             const TileIndex& index, TileSelection selection, WindowMode mode)
    : source_(source), records_(records), index_(index), selection_(selection), mode_(mode) {}

const TileRecord& QueryResolver::select(const BoundingBox& query) const {
    const auto& bounds = index_.bounds();
    if (!bounds) throw OutOfRangeQuery(query);
    if (!query.intersects(*bounds)) throw OutOfRangeQuery(query, *bounds);

    const TileRecord* chosen = nullptr;
    double best = std::numeric_limits<double>::infinity();

    // TODO: mosaic all hits instead of picking one once callers agree on merge semantics.
    for (auto hit : index_.intersect(query)) {
        const TileRecord& record = records_.at(hit.payload());
        if (selection_ == TileSelection::FirstHit) {
            chosen = &record;
            break;
        }
        double delta = std::abs(record.bbox.mid_time() - query.mid_time());
        if (delta < best) {
            best = delta;
            chosen = &record;
        }
    }

    if (!chosen) throw NoTileError(query, *bounds);
    return *chosen;
}

PixelWindow QueryResolver::compute_window(const BoundingBox& query, WindowMode mode,
                                          const GeoMetadata& meta) {
    if (mode == WindowMode::Geotransform) {
        return GeoTransform(meta.transform).window_for(query.minx, query.maxx, query.miny,
                                                       query.maxy, meta.width, meta.height);
    }
    return PixelWindow::covering(query.minx, query.maxx, query.miny, query.maxy,
                                 meta.width, meta.height);
}

Sample QueryResolver::resolve(const BoundingBox& query) const {
    const TileRecord& record = select(query);
    spdlog::debug("Query {} served by {}", to_string(query), record.path);

    auto tile = source_.open(record.path);
    const auto& meta = tile->metadata();

    PixelWindow window;
    try {
        window = compute_window(query, mode_, meta);
    } catch (const std::invalid_argument& e) {
        throw SourceReadError(record.path, e.what());
    }
    if (window.empty()) {
        throw SourceReadError(record.path,
            "window of " + to_string(query) + " lies outside the " +
            std::to_string(meta.width) + "x" + std::to_string(meta.height) + " raster");
    }

    Sample sample;
    sample.image = tile->read_int32(1, window);
    sample.path = record.path;
    sample.timestamp = record.bbox.mint;
    sample.tile_bounds = record.bbox;
    sample.window = window;
    return sample;
}

} // namespace geoscene
