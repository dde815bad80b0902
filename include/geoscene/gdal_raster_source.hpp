#pragma once

#include "geoscene/raster_source.hpp"

namespace geoscene {

// GeoTIFF tiles read through GDAL. Each open() owns a fresh GDALDataset.
class GdalRasterSource : public RasterSource {
public:
    GdalRasterSource();

    std::unique_ptr<RasterDataset> open(const std::string& path) const override;
    std::string file_extension() const override { return ".TIF"; }
};

} // namespace geoscene
