/**
 * @file TestSupport.hpp
 * @brief Minimal check macros and GDAL fixture helpers shared by the tests
 */

#pragma once

#include "rf_profile_generator.hpp"
#include "core/Logger.hpp"
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace rfprof::test {

inline Logger& test_logger() {
    static Logger logger("Test");
    return logger;
}

inline std::string location(const char* file, int line) {
    return std::string(file) + ":" + std::to_string(line);
}

#define RFPROF_CHECK(condition)                                                                   \
    do {                                                                                          \
        if (!(condition)) {                                                                       \
            ::rfprof::test::test_logger().error("Check failed: " #condition " at " +              \
                                                ::rfprof::test::location(__FILE__, __LINE__));    \
            return false;                                                                         \
        }                                                                                         \
    } while (0)

#define RFPROF_CHECK_NEAR(actual, expected, tolerance)                                            \
    do {                                                                                          \
        double rfprof_a_ = (actual);                                                              \
        double rfprof_e_ = (expected);                                                            \
        if (!(std::abs(rfprof_a_ - rfprof_e_) <= (tolerance))) {                                  \
            std::ostringstream rfprof_msg_;                                                       \
            rfprof_msg_ << "Check failed: " #actual " = " << rfprof_a_ << ", expected "           \
                        << rfprof_e_ << " at " << ::rfprof::test::location(__FILE__, __LINE__);   \
            ::rfprof::test::test_logger().error(rfprof_msg_.str());                               \
            return false;                                                                         \
        }                                                                                         \
    } while (0)

#define RFPROF_CHECK_THROWS(expression, exception_type)                                           \
    do {                                                                                          \
        bool rfprof_thrown_ = false;                                                              \
        try {                                                                                     \
            (void)(expression);                                                                   \
        } catch (const exception_type&) {                                                         \
            rfprof_thrown_ = true;                                                                \
        }                                                                                         \
        if (!rfprof_thrown_) {                                                                    \
            ::rfprof::test::test_logger().error("Expected " #exception_type " from " #expression  \
                                                " at " + ::rfprof::test::location(__FILE__, __LINE__)); \
            return false;                                                                         \
        }                                                                                         \
    } while (0)

/**
 * @brief Runs named test functions and reports the number of failures
 */
class TestRunner {
public:
    void run(const std::string& name, const std::function<bool()>& test) {
        bool passed = false;
        try {
            passed = test();
        } catch (const std::exception& e) {
            test_logger().error(name + " threw: " + e.what());
        }
        if (passed) {
            test_logger().info("PASS " + name);
        } else {
            test_logger().error("FAIL " + name);
            ++failures_;
        }
    }

    int result() const {
        if (failures_ > 0) {
            test_logger().error(std::to_string(failures_) + " test(s) failed");
            return 1;
        }
        return 0;
    }

private:
    int failures_ = 0;
};

/**
 * @brief Unique scratch directory removed on destruction
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

/// Single band GeoTIFF with the given transform and coordinate system
inline void write_raster(const std::string& path, const OGRSpatialReference& srs,
                         const std::array<double, 6>& gt, int width, int height,
                         const std::vector<double>& values, std::optional<double> nodata,
                         GDALDataType type) {
    GDALAllRegister();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) {
        throw std::runtime_error("GTiff driver unavailable");
    }

    GDALDataset* dataset = driver->Create(path.c_str(), width, height, 1, type, nullptr);
    if (!dataset) {
        throw std::runtime_error("cannot create " + path);
    }

    std::array<double, 6> transform = gt;
    dataset->SetGeoTransform(transform.data());
    dataset->SetSpatialRef(&srs);

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (nodata.has_value()) {
        band->SetNoDataValue(*nodata);
    }

    std::vector<double> buffer = values;
    CPLErr err = band->RasterIO(GF_Write, 0, 0, width, height, buffer.data(), width, height,
                                GDT_Float64, 0, 0);
    GDALClose(dataset);
    if (err != CE_None) {
        throw std::runtime_error("cannot write " + path);
    }
}

/**
 * @brief Write a single band north-up WGS84 GeoTIFF
 *
 * values are row-major, first row is the northern edge at origin_lat.
 */
inline void write_geotiff(const std::string& path, double origin_lon, double origin_lat, double pixel_deg,
                          int width, int height, const std::vector<double>& values,
                          std::optional<double> nodata = std::nullopt,
                          GDALDataType type = GDT_Float32) {
    OGRSpatialReference wgs84;
    wgs84.SetWellKnownGeogCS("WGS84");
    write_raster(path, wgs84, {origin_lon, pixel_deg, 0.0, origin_lat, 0.0, -pixel_deg},
                 width, height, values, nodata, type);
}

/**
 * @brief North-up raster in a projected EPSG coordinate system, origin and pixel size in metres
 */
inline void write_projected_geotiff(const std::string& path, int epsg, double origin_x, double origin_y,
                                    double pixel_m, int width, int height, const std::vector<double>& values,
                                    std::optional<double> nodata = std::nullopt,
                                    GDALDataType type = GDT_Float32) {
    OGRSpatialReference srs;
    if (srs.importFromEPSG(epsg) != OGRERR_NONE) {
        throw std::runtime_error("unknown EPSG code " + std::to_string(epsg));
    }
    write_raster(path, srs, {origin_x, pixel_m, 0.0, origin_y, 0.0, -pixel_m},
                 width, height, values, nodata, type);
}

/**
 * @brief Constant valued raster covering [lon0, lon0 + span] x [lat0 - span, lat0]
 */
inline void write_constant_geotiff(const std::string& path, double origin_lon, double origin_lat,
                                   double span_deg, int pixels, double value,
                                   std::optional<double> nodata = std::nullopt,
                                   GDALDataType type = GDT_Float32) {
    std::vector<double> values(static_cast<size_t>(pixels) * static_cast<size_t>(pixels), value);
    write_geotiff(path, origin_lon, origin_lat, span_deg / pixels, pixels, pixels, values, nodata, type);
}

inline void write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot write " + path);
    }
    file << text;
}

inline std::string read_text(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/// GeoJSON polygon feature with a zone_type_id property; ring is closed automatically
inline std::string zone_feature(int zone, const std::vector<std::pair<double, double>>& ring) {
    std::ostringstream oss;
    oss.precision(12);
    oss << "{\"type\": \"Feature\", \"properties\": {\"zone_type_id\": " << zone
        << "}, \"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[";
    for (size_t i = 0; i <= ring.size(); ++i) {
        const auto& p = ring[i % ring.size()];
        if (i > 0) oss << ", ";
        oss << "[" << p.first << ", " << p.second << "]";
    }
    oss << "]]}}";
    return oss.str();
}

inline std::string feature_collection(const std::vector<std::string>& features) {
    std::string json = "{\"type\": \"FeatureCollection\", \"features\": [";
    for (size_t i = 0; i < features.size(); ++i) {
        if (i > 0) json += ", ";
        json += features[i];
    }
    return json + "]}";
}

} // namespace rfprof::test
