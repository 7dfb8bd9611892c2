/**
 * @file RasterSource.cpp
 * @brief GDAL backed raster loading and vectorized sampling
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterSource.hpp"
#include "Logger.hpp"
#include <gdal.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>

namespace rfprof {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

namespace {
    std::array<double, 6> invert(const std::array<double, 6>& gt, const std::string& identifier) {
        std::array<double, 6> inverse{};
        double forward[6];
        std::copy(gt.begin(), gt.end(), forward);
        if (!GDALInvGeoTransform(forward, inverse.data())) {
            throw DataUnavailableError("geotransform of " + identifier + " is not invertible");
        }
        return inverse;
    }

    struct CoordinateTransformationDeleter {
        void operator()(OGRCoordinateTransformation* ct) const {
            OGRCoordinateTransformation::DestroyCT(ct);
        }
    };
    using CoordinateTransformationPtr =
        std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

    /**
     * @brief WGS84 lon/lat to the given CRS
     *
     * Created per call; transformation objects are not shared between threads.
     */
    CoordinateTransformationPtr wgs84_to(const std::string& crs_wkt, const std::string& identifier) {
        OGRSpatialReference wgs84;
        wgs84.SetWellKnownGeogCS("WGS84");
        wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

        OGRSpatialReference target;
        if (target.importFromWkt(crs_wkt.c_str()) != OGRERR_NONE) {
            throw DataUnavailableError("unreadable coordinate system in " + identifier);
        }
        target.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

        CoordinateTransformationPtr ct(OGRCreateCoordinateTransformation(&wgs84, &target));
        if (!ct) {
            throw DataUnavailableError("cannot transform WGS84 coordinates into the CRS of " + identifier);
        }
        return ct;
    }

    /// WKT of a projected dataset CRS; empty when the dataset is geographic or has none
    std::string projected_wkt(GDALDataset& dataset, const std::string& path, Logger& logger) {
        const OGRSpatialReference* srs = dataset.GetSpatialRef();
        if (!srs || srs->IsEmpty()) {
            logger.debug("Raster " + path + " has no coordinate system, assuming WGS84 lon/lat");
            return {};
        }
        if (srs->IsGeographic()) {
            return {};
        }

        char* wkt = nullptr;
        if (srs->exportToWkt(&wkt) != OGRERR_NONE || !wkt) {
            CPLFree(wkt);
            throw DataUnavailableError("cannot export coordinate system of " + path);
        }
        std::string result(wkt);
        CPLFree(wkt);
        logger.detailed("Raster " + path + " is projected; samples are transformed into its CRS");
        return result;
    }
}

RasterSource::RasterSource(std::string identifier, std::vector<double> data,
                           size_t width, size_t height,
                           const std::array<double, 6>& geotransform,
                           std::optional<double> nodata,
                           std::string crs_wkt)
    : identifier_(std::move(identifier)), data_(std::move(data)),
      width_(width), height_(height), geotransform_(geotransform), nodata_(nodata),
      crs_wkt_(std::move(crs_wkt)) {
    if (data_.size() != width_ * height_) {
        throw DataUnavailableError("raster " + identifier_ + " has " + std::to_string(data_.size()) +
                                   " values for " + std::to_string(width_) + "x" + std::to_string(height_) + " pixels");
    }
    inverse_geotransform_ = invert(geotransform_, identifier_);
    if (!crs_wkt_.empty()) {
        wgs84_to(crs_wkt_, identifier_);
    }
}

RasterSource RasterSource::open(const std::string& path, const std::optional<BoundingBox>& window) {
    Logger logger("RasterSource");
    GDALAllRegister();

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
    if (!dataset) {
        throw DataUnavailableError("cannot open raster " + path);
    }

    std::array<double, 6> gt{};
    if (dataset->GetGeoTransform(gt.data()) != CE_None) {
        throw DataUnavailableError("raster " + path + " has no geotransform");
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!band) {
        throw DataUnavailableError("raster " + path + " has no band 1");
    }

    std::string crs_wkt = projected_wkt(*dataset, path, logger);

    int has_nodata = 0;
    double nodata_value = band->GetNoDataValue(&has_nodata);
    std::optional<double> nodata;
    if (has_nodata) {
        nodata = nodata_value;
    }

    int raster_width = dataset->GetRasterXSize();
    int raster_height = dataset->GetRasterYSize();
    int x_off = 0;
    int y_off = 0;
    int x_size = raster_width;
    int y_size = raster_height;

    if (window.has_value()) {
        auto inverse = invert(gt, path);

        // Window outline in raster coordinates; edge midpoints follow the curvature of projected edges
        double mid_x = 0.5 * (window->min_x + window->max_x);
        double mid_y = 0.5 * (window->min_y + window->max_y);
        double wx[8] = {window->min_x, window->max_x, window->min_x, window->max_x,
                        mid_x, mid_x, window->min_x, window->max_x};
        double wy[8] = {window->min_y, window->min_y, window->max_y, window->max_y,
                        window->min_y, window->max_y, mid_y, mid_y};
        int transformed[8] = {1, 1, 1, 1, 1, 1, 1, 1};
        if (!crs_wkt.empty()) {
            wgs84_to(crs_wkt, path)->Transform(8, wx, wy, nullptr, transformed);
        }

        // Pixel extent of the outline; works for north-up and south-up rasters
        double px_min = std::numeric_limits<double>::infinity(), px_max = -px_min;
        double py_min = px_min, py_max = -px_min;
        for (int i = 0; i < 8; ++i) {
            if (!transformed[i]) continue;
            double px, py;
            GDALApplyGeoTransform(inverse.data(), wx[i], wy[i], &px, &py);
            px_min = std::min(px_min, px);
            px_max = std::max(px_max, px);
            py_min = std::min(py_min, py);
            py_max = std::max(py_max, py);
        }
        if (!std::isfinite(px_min) || !std::isfinite(py_min)) {
            throw DataUnavailableError("sampling window cannot be expressed in the CRS of " + path);
        }

        int col_min = std::max(0, static_cast<int>(std::floor(px_min)));
        int row_min = std::max(0, static_cast<int>(std::floor(py_min)));
        int col_max = std::min(raster_width, static_cast<int>(std::ceil(px_max)) + 1);
        int row_max = std::min(raster_height, static_cast<int>(std::ceil(py_max)) + 1);

        x_off = col_min;
        y_off = row_min;
        x_size = col_max - col_min;
        y_size = row_max - row_min;

        if (x_size <= 0 || y_size <= 0) {
            logger.warning("Raster " + path + " does not cover the requested window");
            return RasterSource(path, {}, 0, 0, gt, nodata, crs_wkt);
        }
    }

    std::vector<double> data(static_cast<size_t>(x_size) * static_cast<size_t>(y_size));
    CPLErr err = band->RasterIO(GF_Read, x_off, y_off, x_size, y_size,
                                data.data(), x_size, y_size, GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw DataUnavailableError("failed to read raster " + path + ": " + CPLGetLastErrorMsg());
    }

    // Shift the transform origin to the extracted window
    std::array<double, 6> window_gt = gt;
    window_gt[0] = gt[0] + x_off * gt[1] + y_off * gt[2];
    window_gt[3] = gt[3] + x_off * gt[4] + y_off * gt[5];

    std::ostringstream msg;
    msg << "Loaded " << path << ": " << x_size << "x" << y_size << " pixels";
    if (window.has_value()) {
        msg << " (window of " << raster_width << "x" << raster_height << ")";
    }
    logger.detailed(msg.str());

    return RasterSource(path, std::move(data), static_cast<size_t>(x_size),
                        static_cast<size_t>(y_size), window_gt, nodata, std::move(crs_wkt));
}

bool RasterSource::is_valid_value(double value) const {
    if (std::isnan(value)) {
        return false;
    }
    return !(nodata_.has_value() && value == nodata_.value());
}

void RasterSource::to_raster_crs(const std::vector<GeoPoint>& points, std::vector<double>& xs,
                                 std::vector<double>& ys) const {
    const size_t n = points.size();
    xs.resize(n);
    ys.resize(n);
    for (size_t i = 0; i < n; ++i) {
        xs[i] = points[i].lon;
        ys[i] = points[i].lat;
    }
    if (crs_wkt_.empty() || n == 0) {
        return;
    }

    std::vector<int> success(n, 0);
    wgs84_to(crs_wkt_, identifier_)->Transform(n, xs.data(), ys.data(), nullptr, success.data());
    for (size_t i = 0; i < n; ++i) {
        if (!success[i]) {
            xs[i] = std::nan("");
            ys[i] = std::nan("");
        }
    }
}

long long RasterSource::pixel_index(const GeoPoint& point) const {
    if (data_.empty()) {
        return -1;
    }
    std::vector<double> xs, ys;
    to_raster_crs({point}, xs, ys);
    return pixel_index_xy(xs[0], ys[0]);
}

long long RasterSource::pixel_index_xy(double x, double y) const {
    if (data_.empty()) {
        return -1;
    }
    const auto& inv = inverse_geotransform_;
    double px = inv[0] + x * inv[1] + y * inv[2];
    double py = inv[3] + x * inv[4] + y * inv[5];
    if (!std::isfinite(px) || !std::isfinite(py)) {
        return -1;
    }

    double col = std::floor(px);
    double row = std::floor(py);
    if (col < 0.0 || row < 0.0 || col >= static_cast<double>(width_) || row >= static_cast<double>(height_)) {
        return -1;
    }
    return static_cast<long long>(row) * static_cast<long long>(width_) + static_cast<long long>(col);
}

RasterSource::Samples RasterSource::sample(const std::vector<GeoPoint>& points) const {
    const size_t n = points.size();

    // Pass 1: coordinates to flat pixel indices
    std::vector<long long> indices(n, -1);
    if (!data_.empty()) {
        std::vector<double> xs, ys;
        to_raster_crs(points, xs, ys);
        for (size_t i = 0; i < n; ++i) {
            indices[i] = pixel_index_xy(xs[i], ys[i]);
        }
    }

    // Pass 2: gather
    Samples samples;
    samples.values.assign(n, 0.0);
    samples.valid.assign(n, 0);
    for (size_t i = 0; i < n; ++i) {
        if (indices[i] < 0) continue;
        double value = data_[static_cast<size_t>(indices[i])];
        if (is_valid_value(value)) {
            samples.values[i] = value;
            samples.valid[i] = 1;
            samples.valid_count++;
        }
    }
    return samples;
}

std::optional<double> RasterSource::sample_at(const GeoPoint& point) const {
    long long index = pixel_index(point);
    if (index < 0) {
        return std::nullopt;
    }
    double value = data_[static_cast<size_t>(index)];
    if (!is_valid_value(value)) {
        return std::nullopt;
    }
    return value;
}

BoundingBox RasterSource::bounds() const {
    double xs[4], ys[4];
    double w = static_cast<double>(width_);
    double h = static_cast<double>(height_);
    const double corners[4][2] = {{0.0, 0.0}, {w, 0.0}, {0.0, h}, {w, h}};
    for (int i = 0; i < 4; ++i) {
        xs[i] = geotransform_[0] + corners[i][0] * geotransform_[1] + corners[i][1] * geotransform_[2];
        ys[i] = geotransform_[3] + corners[i][0] * geotransform_[4] + corners[i][1] * geotransform_[5];
    }
    return BoundingBox(*std::min_element(xs, xs + 4), *std::min_element(ys, ys + 4),
                       *std::max_element(xs, xs + 4), *std::max_element(ys, ys + 4));
}

} // namespace rfprof
