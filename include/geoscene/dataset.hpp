#pragma once

#include "geoscene/bounding_box.hpp"
#include "geoscene/query_resolver.hpp"
#include "geoscene/raster_source.hpp"
#include "geoscene/sensors.hpp"
#include "geoscene/spatial_index.hpp"
#include "geoscene/tile_catalog.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geoscene {

struct DatasetOptions {
    std::string root = "data";
    Sensor sensor = Sensor::Landsat8;
    std::vector<std::string> bands;     // empty selects every band of the sensor
    TileSelection selection = TileSelection::FirstHit;
    WindowMode window_mode = WindowMode::PixelSpace;
};

// Scenes of one sensor under root/<base_folder>, indexed by (x, y, time)
// at construction and read-only afterwards.
class Dataset {
public:
    Dataset(std::shared_ptr<const RasterSource> source, DatasetOptions options);

    Dataset(const Dataset&) = delete;
    Dataset& operator=(const Dataset&) = delete;

    // Band 1 of the selected tile, windowed to the query.
    Sample query(const BoundingBox& query) const { return resolver_.resolve(query); }
    Sample operator[](const BoundingBox& query) const { return resolver_.resolve(query); }

    const std::optional<BoundingBox>& bounds() const { return index_.bounds(); }
    std::size_t size() const { return records_.size(); }
    const std::vector<TileRecord>& records() const { return records_; }
    const std::vector<ScanWarning>& warnings() const { return warnings_; }
    const TileIndex& index() const { return index_; }

    const DatasetOptions& options() const { return options_; }
    const std::vector<std::string>& bands() const { return options_.bands; }
    const SensorConfig& sensor() const { return sensor_config(options_.sensor); }

private:
    std::shared_ptr<const RasterSource> source_;
    DatasetOptions options_;
    std::vector<TileRecord> records_;
    std::vector<ScanWarning> warnings_;
    TileIndex index_;
    QueryResolver resolver_;
};

} // namespace geoscene
