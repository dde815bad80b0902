#pragma once

#include <string>
#include <vector>

namespace geoscene {

enum class Sensor {
    Landsat1,
    Landsat2,
    Landsat3,
    Landsat4MSS,
    Landsat5MSS,
    Landsat4TM,
    Landsat5TM,
    Landsat7,
    Landsat8,
    Landsat9,
};

// Static per-instrument data. Sensor generations sharing an instrument
// share one entry.
struct SensorConfig {
    const char* name;
    const char* base_folder;
    std::vector<std::string> band_names;
};

const SensorConfig& sensor_config(Sensor sensor);

// Accepts enum spellings case-insensitively, e.g. "landsat8" or "Landsat4TM".
Sensor sensor_from_name(const std::string& name);
const char* sensor_name(Sensor sensor);

// Throws std::invalid_argument on a band the sensor does not record.
void validate_bands(Sensor sensor, const std::vector<std::string>& bands);

} // namespace geoscene
