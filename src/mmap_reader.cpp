#include "geoscene/mmap_reader.hpp"
#include "geoscene/errors.hpp"

#include <fstream>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

// Minimal JSON parsing (no deps)
namespace {
std::string extract_string(const std::string& json, const std::string& key) {
    auto pos = json.find("\"" + key + "\"");
    if (pos == std::string::npos) return "";
    pos = json.find(':', pos);
    auto start = json.find('"', pos) + 1;
    auto end = json.find('"', start);
    return json.substr(start, end - start);
}

int extract_int(const std::string& json, const std::string& key) {
    auto pos = json.find("\"" + key + "\"");
    if (pos == std::string::npos) throw std::runtime_error("Missing \"" + key + "\" in metadata");
    pos = json.find(':', pos) + 1;
    while (json[pos] == ' ') pos++;
    return std::stoi(json.substr(pos));
}

std::array<double, 6> extract_transform(const std::string& json) {
    std::array<double, 6> result{};
    auto pos = json.find("\"transform\"");
    if (pos == std::string::npos) throw std::runtime_error("Missing \"transform\" in metadata");
    pos = json.find('[', pos);
    for (int i = 0; i < 6; i++) {
        pos++;
        while (json[pos] == ' ' || json[pos] == '\n') pos++;
        result[i] = std::stod(json.substr(pos));
        pos = json.find_first_of(",]", pos);
        if (pos == std::string::npos) throw std::runtime_error("Truncated \"transform\" in metadata");
    }
    return result;
}

template<typename T>
void copy_band(const geoscene::WindowView& view, int band, geoscene::Raster<int32_t>& out) {
    for (int y = 0; y < view.height; y++) {
        for (int x = 0; x < view.width; x++) {
            out.at(y, x) = geoscene::sample_to_int32(view.at<T>(band, y, x));
        }
    }
}

std::string strip_extension(const std::string& path) {
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return path;
    return path.substr(0, dot);
}

class MMapRasterDataset : public geoscene::RasterDataset {
public:
    MMapRasterDataset(std::string path, geoscene::MMapReader reader)
        : path_(std::move(path)), reader_(std::move(reader)) {}

    const geoscene::GeoMetadata& metadata() const override { return reader_.metadata(); }

    geoscene::Raster<int32_t> read_int32(int band, const geoscene::PixelWindow& w) const override {
        try {
            return reader_.read_int32(band - 1, w.col_off, w.row_off, w.width, w.height);
        } catch (const std::exception& e) {
            throw geoscene::SourceReadError(path_, e.what());
        }
    }

private:
    std::string path_;
    geoscene::MMapReader reader_;
};
}

namespace geoscene {

MMapReader::MMapReader(const std::string& base_path) {
    // Load JSON metadata
    std::ifstream json_file(base_path + ".json");
    if (!json_file) throw std::runtime_error("Cannot open " + base_path + ".json");

    std::string json((std::istreambuf_iterator<char>(json_file)), std::istreambuf_iterator<char>());

    meta_.dtype = extract_string(json, "dtype");
    meta_.count = extract_int(json, "count");
    meta_.height = extract_int(json, "height");
    meta_.width = extract_int(json, "width");
    meta_.transform = extract_transform(json);
    meta_.crs = extract_string(json, "crs");

    if (meta_.count <= 0 || meta_.height <= 0 || meta_.width <= 0) {
        throw std::runtime_error("Invalid raster shape in " + base_path + ".json");
    }

    // Memory map binary file
    std::string bin_path = base_path + ".bin";
    fd_ = open(bin_path.c_str(), O_RDONLY);
    if (fd_ < 0) throw std::runtime_error("Cannot open " + bin_path);

    struct stat st;
    if (fstat(fd_, &st) != 0) {
        release();
        throw std::runtime_error("Cannot stat " + bin_path + ": " + std::strerror(errno));
    }
    mapped_size_ = st.st_size;
    if (mapped_size_ < meta_.total_bytes()) {
        release();
        throw std::runtime_error(bin_path + " is smaller than its metadata declares");
    }

    mapped_data_ = mmap(nullptr, mapped_size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (mapped_data_ == MAP_FAILED) {
        mapped_data_ = nullptr;
        release();
        throw std::runtime_error("mmap failed");
    }

    // Advise kernel for random access
    madvise(mapped_data_, mapped_size_, MADV_RANDOM);
}

MMapReader::~MMapReader() {
    release();
}

void MMapReader::release() {
    if (mapped_data_ && mapped_data_ != MAP_FAILED) {
        munmap(mapped_data_, mapped_size_);
    }
    if (fd_ >= 0) close(fd_);
    mapped_data_ = nullptr;
    fd_ = -1;
}

MMapReader::MMapReader(MMapReader&& other) noexcept
    : meta_(std::move(other.meta_))
    , mapped_data_(other.mapped_data_)
    , mapped_size_(other.mapped_size_)
    , fd_(other.fd_) {
    other.mapped_data_ = nullptr;
    other.fd_ = -1;
}

MMapReader& MMapReader::operator=(MMapReader&& other) noexcept {
    if (this != &other) {
        release();

        meta_ = std::move(other.meta_);
        mapped_data_ = other.mapped_data_;
        mapped_size_ = other.mapped_size_;
        fd_ = other.fd_;

        other.mapped_data_ = nullptr;
        other.fd_ = -1;
    }
    return *this;
}

bool MMapReader::is_valid_window(int x, int y, int width, int height) const {
    return x >= 0 && y >= 0 &&
           x + width <= meta_.width &&
           y + height <= meta_.height &&
           width > 0 && height > 0;
}

WindowView MMapReader::get_window(int x, int y, int width, int height) const {
    if (!is_valid_window(x, y, width, height)) {
        throw std::out_of_range("Window out of bounds");
    }

    size_t psize = meta_.pixel_size();
    size_t band_stride = static_cast<size_t>(meta_.height) * meta_.width * psize;
    size_t row_stride = static_cast<size_t>(meta_.width) * psize;

    const uint8_t* base = static_cast<const uint8_t*>(mapped_data_);
    const uint8_t* window_start = base + y * row_stride + x * psize;

    return WindowView{
        window_start,
        meta_.count,
        height,
        width,
        band_stride,
        row_stride,
        psize
    };
}

Raster<int32_t> MMapReader::read_int32(int band, int x, int y, int width, int height) const {
    if (band < 0 || band >= meta_.count) {
        throw std::out_of_range("Band " + std::to_string(band + 1) + " out of range");
    }
    auto view = get_window(x, y, width, height);
    Raster<int32_t> out(width, height);

    const auto& dtype = meta_.dtype;
    if (dtype == "uint8") copy_band<uint8_t>(view, band, out);
    else if (dtype == "int8") copy_band<int8_t>(view, band, out);
    else if (dtype == "uint16") copy_band<uint16_t>(view, band, out);
    else if (dtype == "int16") copy_band<int16_t>(view, band, out);
    else if (dtype == "uint32") copy_band<uint32_t>(view, band, out);
    else if (dtype == "int32") copy_band<int32_t>(view, band, out);
    else if (dtype == "float32") copy_band<float>(view, band, out);
    else if (dtype == "float64") copy_band<double>(view, band, out);
    else throw std::runtime_error("Unsupported dtype: " + dtype);

    return out;
}

std::unique_ptr<RasterDataset> MMapRasterSource::open(const std::string& path) const {
    try {
        return std::make_unique<MMapRasterDataset>(path, MMapReader(strip_extension(path)));
    } catch (const std::exception& e) {
        throw SourceReadError(path, e.what());
    }
}

} // namespace geoscene
