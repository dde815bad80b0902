#pragma once

#include "geoscene/bounding_box.hpp"
#include "geoscene/dataset.hpp"
#include "geoscene/errors.hpp"
#include "geoscene/geo_transform.hpp"
#include "geoscene/mmap_reader.hpp"
#include "geoscene/query_resolver.hpp"
#include "geoscene/raster_source.hpp"
#include "geoscene/sensors.hpp"
#include "geoscene/spatial_index.hpp"
#include "geoscene/tile_catalog.hpp"

namespace geoscene {

constexpr const char* VERSION = "0.1.0";

} // namespace geoscene
