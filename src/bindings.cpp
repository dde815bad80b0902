#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "geoscene/geoscene.hpp"
#ifdef GEOSCENE_HAS_GDAL
#include "geoscene/gdal_raster_source.hpp"
#endif

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace {

py::array_t<int32_t> to_numpy(const geoscene::Raster<int32_t>& image) {
    std::vector<ssize_t> shape = {image.height, image.width};
    py::array_t<int32_t> array(shape);
    std::memcpy(array.mutable_data(), image.data.data(), image.data.size() * sizeof(int32_t));
    return array;
}

geoscene::Sensor to_sensor(const py::object& sensor) {
    if (py::isinstance<py::str>(sensor)) {
        return geoscene::sensor_from_name(sensor.cast<std::string>());
    }
    return sensor.cast<geoscene::Sensor>();
}

#ifdef GEOSCENE_HAS_GDAL
constexpr const char* DEFAULT_SOURCE = "gdal";
#else
constexpr const char* DEFAULT_SOURCE = "mmap";
#endif

std::shared_ptr<const geoscene::RasterSource> make_source(const std::string& name) {
    if (name == "mmap") return std::make_shared<geoscene::MMapRasterSource>();
#ifdef GEOSCENE_HAS_GDAL
    if (name == "gdal") return std::make_shared<geoscene::GdalRasterSource>();
#endif
    throw std::invalid_argument("Unknown or unavailable raster source: " + name);
}

}

PYBIND11_MODULE(_geoscene_cpp, m) {
    m.doc() = "GeoScene C++ backend for spatiotemporal tile indexing and windowed reads";
    m.attr("__version__") = geoscene::VERSION;
    m.attr("default_source") = DEFAULT_SOURCE;

    py::register_exception<geoscene::SourceReadError>(m, "SourceReadError", PyExc_RuntimeError);

    py::class_<geoscene::BoundingBox>(m, "BoundingBox")
        .def(py::init<double, double, double, double, double, double>(),
             py::arg("minx"), py::arg("maxx"), py::arg("miny"), py::arg("maxy"),
             py::arg("mint"), py::arg("maxt"))
        .def_readonly("minx", &geoscene::BoundingBox::minx)
        .def_readonly("maxx", &geoscene::BoundingBox::maxx)
        .def_readonly("miny", &geoscene::BoundingBox::miny)
        .def_readonly("maxy", &geoscene::BoundingBox::maxy)
        .def_readonly("mint", &geoscene::BoundingBox::mint)
        .def_readonly("maxt", &geoscene::BoundingBox::maxt)
        .def("intersects", &geoscene::BoundingBox::intersects)
        .def("__repr__", [](const geoscene::BoundingBox& b) { return geoscene::to_string(b); });

    py::enum_<geoscene::Sensor>(m, "Sensor")
        .value("Landsat1", geoscene::Sensor::Landsat1)
        .value("Landsat2", geoscene::Sensor::Landsat2)
        .value("Landsat3", geoscene::Sensor::Landsat3)
        .value("Landsat4MSS", geoscene::Sensor::Landsat4MSS)
        .value("Landsat5MSS", geoscene::Sensor::Landsat5MSS)
        .value("Landsat4TM", geoscene::Sensor::Landsat4TM)
        .value("Landsat5TM", geoscene::Sensor::Landsat5TM)
        .value("Landsat7", geoscene::Sensor::Landsat7)
        .value("Landsat8", geoscene::Sensor::Landsat8)
        .value("Landsat9", geoscene::Sensor::Landsat9);

    py::enum_<geoscene::TileSelection>(m, "TileSelection")
        .value("FirstHit", geoscene::TileSelection::FirstHit)
        .value("NearestTime", geoscene::TileSelection::NearestTime);

    py::enum_<geoscene::WindowMode>(m, "WindowMode")
        .value("PixelSpace", geoscene::WindowMode::PixelSpace)
        .value("Geotransform", geoscene::WindowMode::Geotransform);

    py::class_<geoscene::Dataset>(m, "Dataset")
        .def(py::init([](const std::string& root, const py::object& sensor,
                         std::vector<std::string> bands, geoscene::TileSelection selection,
                         geoscene::WindowMode mode, const std::string& source) {
                 geoscene::DatasetOptions options;
                 options.root = root;
                 options.sensor = to_sensor(sensor);
                 options.bands = std::move(bands);
                 options.selection = selection;
                 options.window_mode = mode;
                 return std::make_unique<geoscene::Dataset>(make_source(source), std::move(options));
             }),
             py::arg("root") = "data", py::arg("sensor") = geoscene::Sensor::Landsat8,
             py::arg("bands") = std::vector<std::string>{},
             py::arg("selection") = geoscene::TileSelection::FirstHit,
             py::arg("window_mode") = geoscene::WindowMode::PixelSpace,
             py::arg("source") = DEFAULT_SOURCE)
        .def_property_readonly("bounds", &geoscene::Dataset::bounds)
        .def_property_readonly("bands", &geoscene::Dataset::bands)
        .def_property_readonly("warnings", [](const geoscene::Dataset& ds) {
            std::vector<std::pair<std::string, std::string>> out;
            for (const auto& w : ds.warnings()) out.emplace_back(w.path, w.reason);
            return out;
        })
        .def("__len__", &geoscene::Dataset::size)
        .def("__getitem__", [](const geoscene::Dataset& ds, const geoscene::BoundingBox& query) {
            geoscene::Sample sample = ds.query(query);
            py::dict result;
            result["image"] = to_numpy(sample.image);
            result["path"] = sample.path;
            result["timestamp"] = sample.timestamp;
            return result;
        }, py::arg("query"));
}
