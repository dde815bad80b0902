#include "geoscene/gdal_raster_source.hpp"
#include "geoscene/errors.hpp"
#include "geoscene/geo_transform.hpp"

#include <gdal_priv.h>
#include <cpl_error.h>

#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

struct GdalDatasetCloser {
    void operator()(GDALDataset* dset) const {
        if (dset) GDALClose(static_cast<GDALDatasetH>(dset));
    }
};

using GdalDatasetPtr = std::unique_ptr<GDALDataset, GdalDatasetCloser>;

std::string dtype_name(GDALDataType type) {
    switch (type) {
        case GDT_Byte: return "uint8";
        case GDT_UInt16: return "uint16";
        case GDT_Int16: return "int16";
        case GDT_UInt32: return "uint32";
        case GDT_Int32: return "int32";
        case GDT_Float32: return "float32";
        case GDT_Float64: return "float64";
        default: return GDALGetDataTypeName(type);
    }
}

// Read a window in the band's native type, then convert like every source.
template<typename T>
geoscene::Raster<int32_t> read_native(GDALRasterBand* band, GDALDataType type,
                                      const geoscene::PixelWindow& w, const std::string& path) {
    std::vector<T> buffer(static_cast<size_t>(w.width) * w.height);
    CPLErr err = band->RasterIO(GF_Read, w.col_off, w.row_off, w.width, w.height,
                                buffer.data(), w.width, w.height, type, 0, 0, nullptr);
    if (err != CE_None) {
        throw geoscene::SourceReadError(path, CPLGetLastErrorMsg());
    }
    geoscene::Raster<int32_t> out(w.width, w.height);
    for (size_t i = 0; i < buffer.size(); i++) {
        out.data[i] = geoscene::sample_to_int32(buffer[i]);
    }
    return out;
}

class GdalRasterDataset : public geoscene::RasterDataset {
public:
    GdalRasterDataset(std::string path, GdalDatasetPtr dset)
        : path_(std::move(path)), dset_(std::move(dset)) {
        double gt[6];
        if (dset_->GetGeoTransform(gt) != CE_None) {
            throw geoscene::SourceReadError(path_, "missing geotransform");
        }
        try {
            meta_.transform = geoscene::GeoTransform::from_gdal(gt).coefficients();
        } catch (const std::invalid_argument& e) {
            throw geoscene::SourceReadError(path_, e.what());
        }
        meta_.count = dset_->GetRasterCount();
        meta_.width = dset_->GetRasterXSize();
        meta_.height = dset_->GetRasterYSize();
        if (meta_.count < 1) {
            throw geoscene::SourceReadError(path_, "no raster bands");
        }
        meta_.dtype = dtype_name(dset_->GetRasterBand(1)->GetRasterDataType());
        const char* wkt = dset_->GetProjectionRef();
        meta_.crs = wkt ? wkt : "";
    }

    const geoscene::GeoMetadata& metadata() const override { return meta_; }

    geoscene::Raster<int32_t> read_int32(int band, const geoscene::PixelWindow& w) const override {
        if (band < 1 || band > meta_.count) {
            throw geoscene::SourceReadError(path_, "band " + std::to_string(band) + " out of range");
        }
        GDALRasterBand* rb = dset_->GetRasterBand(band);
        switch (rb->GetRasterDataType()) {
            case GDT_Byte: return read_native<uint8_t>(rb, GDT_Byte, w, path_);
            case GDT_UInt16: return read_native<uint16_t>(rb, GDT_UInt16, w, path_);
            case GDT_Int16: return read_native<int16_t>(rb, GDT_Int16, w, path_);
            case GDT_UInt32: return read_native<uint32_t>(rb, GDT_UInt32, w, path_);
            case GDT_Int32: return read_native<int32_t>(rb, GDT_Int32, w, path_);
            case GDT_Float32: return read_native<float>(rb, GDT_Float32, w, path_);
            default: return read_native<double>(rb, GDT_Float64, w, path_);
        }
    }

private:
    std::string path_;
    GdalDatasetPtr dset_;
    geoscene::GeoMetadata meta_;
};

}

namespace geoscene {

GdalRasterSource::GdalRasterSource() {
    static std::once_flag registered;
    std::call_once(registered, [] { GDALAllRegister(); });
}

std::unique_ptr<RasterDataset> GdalRasterSource::open(const std::string& path) const {
    GdalDatasetPtr dset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dset) {
        throw SourceReadError(path, CPLGetLastErrorMsg());
    }
    return std::make_unique<GdalRasterDataset>(path, std::move(dset));
}

} // namespace geoscene
