#include "geoscene/dataset.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace geoscene {

namespace {

DatasetOptions checked(DatasetOptions options) {
    if (options.bands.empty()) {
        options.bands = sensor_config(options.sensor).band_names;
    }
    validate_bands(options.sensor, options.bands);
    return options;
}

std::shared_ptr<const RasterSource> require(std::shared_ptr<const RasterSource> source) {
    if (!source) throw std::invalid_argument("Dataset requires a raster source");
    return source;
}

} // namespace

Dataset::Dataset(std::shared_ptr<const RasterSource> source, DatasetOptions options)
    : source_(require(std::move(source)))
    , options_(checked(std::move(options)))
    , resolver_(*source_, records_, index_, options_.selection, options_.window_mode) {
    const auto& config = sensor_config(options_.sensor);

    // One file per scene: the first requested band stands in for the rest.
    ScanResult scanned = scan(*source_, options_.root, config.base_folder, options_.bands.front());
    records_ = std::move(scanned.records);
    warnings_ = std::move(scanned.warnings);

    for (std::size_t i = 0; i < records_.size(); i++) {
        index_.insert(records_[i].bbox, i);
    }

    if (records_.empty()) {
        spdlog::warn("No {} tiles found under {}", sensor_name(options_.sensor),
                     (std::filesystem::path(options_.root) / config.base_folder).string());
    } else {
        spdlog::info("Indexed {} {} tiles ({} skipped), bounds {}", records_.size(),
                     sensor_name(options_.sensor), warnings_.size(), to_string(*index_.bounds()));
    }
}

} // namespace geoscene
