#include "geoscene/tile_catalog.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;
namespace gregorian = boost::gregorian;

namespace geoscene {

namespace {

constexpr std::size_t DATE_TOKEN = 3;
constexpr double SECONDS_PER_DAY = 86400.0;

const gregorian::date EPOCH(1970, 1, 1);

std::string nth_token(const std::string& name, std::size_t n) {
    std::size_t start = 0;
    for (std::size_t i = 0; i < n; i++) {
        start = name.find('_', start);
        if (start == std::string::npos) return "";
        start++;
    }
    return name.substr(start, name.find('_', start) - start);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

double parse_acquisition_time(const std::string& filename) {
    const std::string name = fs::path(filename).filename().string();
    const std::string token = nth_token(name, DATE_TOKEN);

    if (token.size() != 8 ||
        !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("No YYYYMMDD date in field " + std::to_string(DATE_TOKEN) +
                                    " of " + name);
    }

    int year = std::stoi(token.substr(0, 4));
    int month = std::stoi(token.substr(4, 2));
    int day = std::stoi(token.substr(6, 2));

    try {
        gregorian::date date(year, month, day);
        return static_cast<double>((date - EPOCH).days()) * SECONDS_PER_DAY;
    } catch (const std::out_of_range& e) {
        throw std::invalid_argument("Invalid date " + token + " in " + name + ": " + e.what());
    }
}

ScanResult scan(const RasterSource& source, const std::string& root,
                const std::string& subfolder, const std::string& band_marker) {
    ScanResult result;
    const fs::path dir = fs::path(root) / subfolder;
    const std::string suffix = "_" + band_marker + source.file_extension();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        spdlog::warn("Tile directory {} does not exist", dir.string());
        result.warnings.push_back({dir.string(), "not a directory"});
        return result;
    }

    std::vector<fs::path> matches;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && ends_with(it->path().filename().string(), suffix)) {
            matches.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::warn("Listing {} failed: {}", dir.string(), ec.message());
        result.warnings.push_back({dir.string(), ec.message()});
    }
    std::sort(matches.begin(), matches.end());

    for (const auto& file : matches) {
        const std::string path = file.string();
        try {
            double t = parse_acquisition_time(path);
            BoundingBox spatial = source.open(path)->bounds();
            result.records.push_back({
                BoundingBox(spatial.minx, spatial.maxx, spatial.miny, spatial.maxy, t, t),
                path});
        } catch (const std::exception& e) {
            spdlog::warn("Skipping tile {}: {}", path, e.what());
            result.warnings.push_back({path, e.what()});
        }
    }

    spdlog::debug("Scanned {}: {} tiles, {} skipped", dir.string(),
                  result.records.size(), result.warnings.size());
    return result;
}

} // namespace geoscene
