#pragma once

#include "geoscene/bounding_box.hpp"
#include "geoscene/raster_source.hpp"

#include <string>
#include <vector>

namespace geoscene {

struct TileRecord {
    BoundingBox bbox;
    std::string path;
};

// A tile file skipped during a scan.
struct ScanWarning {
    std::string path;
    std::string reason;
};

struct ScanResult {
    std::vector<TileRecord> records;
    std::vector<ScanWarning> warnings;
};

// Acquisition date from the 4th '_' token (YYYYMMDD) of a file name, as
// Unix seconds at 00:00 UTC. Throws std::invalid_argument if absent or invalid.
//   LC08_L1TP_044034_20210508_20210518_02_T1_B1.TIF -> 2021-05-08
double parse_acquisition_time(const std::string& filename);

// Index one representative band file per scene found directly in
// root/subfolder. Files that cannot be parsed or opened are reported in
// ScanResult::warnings and skipped.
ScanResult scan(const RasterSource& source, const std::string& root,
                const std::string& subfolder, const std::string& band_marker);

} // namespace geoscene
