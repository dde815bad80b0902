#include "geoscene/sensors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace geoscene {

namespace {

// https://www.usgs.gov/faqs/what-are-band-designations-landsat-satellites
const SensorConfig LANDSAT_1_3 = {
    "Landsat1", "landsat_1_3", {"B4", "B5", "B6", "B7"}};

const SensorConfig LANDSAT_4_5_MSS = {
    "Landsat4MSS", "landsat_4_5_mss", {"B1", "B2", "B3", "B4"}};

const SensorConfig LANDSAT_4_5_TM = {
    "Landsat4TM", "landsat_4_5_tm", {"B1", "B2", "B3", "B4", "B5", "B6", "B7"}};

const SensorConfig LANDSAT_7 = {
    "Landsat7", "landsat_7", {"B1", "B2", "B3", "B4", "B5", "B6", "B7", "B8"}};

const SensorConfig LANDSAT_8_9 = {
    "Landsat8", "landsat_8_9",
    {"B1", "B2", "B3", "B4", "B5", "B6", "B7", "B8", "B9", "B10", "B11"}};

struct NamedSensor {
    const char* name;
    Sensor sensor;
};

const NamedSensor SENSOR_NAMES[] = {
    {"Landsat1", Sensor::Landsat1},
    {"Landsat2", Sensor::Landsat2},
    {"Landsat3", Sensor::Landsat3},
    {"Landsat4MSS", Sensor::Landsat4MSS},
    {"Landsat5MSS", Sensor::Landsat5MSS},
    {"Landsat4TM", Sensor::Landsat4TM},
    {"Landsat5TM", Sensor::Landsat5TM},
    {"Landsat7", Sensor::Landsat7},
    {"Landsat8", Sensor::Landsat8},
    {"Landsat9", Sensor::Landsat9},
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const SensorConfig& sensor_config(Sensor sensor) {
    switch (sensor) {
        case Sensor::Landsat1:
        case Sensor::Landsat2:
        case Sensor::Landsat3:
            return LANDSAT_1_3;
        case Sensor::Landsat4MSS:
        case Sensor::Landsat5MSS:
            return LANDSAT_4_5_MSS;
        case Sensor::Landsat4TM:
        case Sensor::Landsat5TM:
            return LANDSAT_4_5_TM;
        case Sensor::Landsat7:
            return LANDSAT_7;
        case Sensor::Landsat8:
        case Sensor::Landsat9:
            return LANDSAT_8_9;
    }
    throw std::invalid_argument("Unknown sensor");
}

Sensor sensor_from_name(const std::string& name) {
    const std::string key = lower(name);
    for (const auto& entry : SENSOR_NAMES) {
        if (lower(entry.name) == key) return entry.sensor;
    }
    throw std::invalid_argument("Unknown sensor: " + name);
}

const char* sensor_name(Sensor sensor) {
    for (const auto& entry : SENSOR_NAMES) {
        if (entry.sensor == sensor) return entry.name;
    }
    throw std::invalid_argument("Unknown sensor");
}

void validate_bands(Sensor sensor, const std::vector<std::string>& bands) {
    const auto& config = sensor_config(sensor);
    for (const auto& band : bands) {
        if (std::find(config.band_names.begin(), config.band_names.end(), band) ==
            config.band_names.end()) {
            throw std::invalid_argument("Band " + band + " is not provided by " +
                                        sensor_name(sensor));
        }
    }
}

} // namespace geoscene
