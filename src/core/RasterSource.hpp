#pragma once

/**
 * @file RasterSource.hpp
 * @brief One georeferenced raster band held resident for batch sampling
 */

#include "rf_profile_generator.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Resident raster band with its affine transform
 *
 * Sampling a batch never touches the file: all coordinates are mapped to
 * pixel space in one pass and all values gathered in a second one.
 *
 * Sample coordinates are always WGS84 lon/lat. A raster in a projected CRS
 * keeps that CRS as WKT and the batch is transformed into it before the
 * pixel mapping; geotransform and bounds() stay in the raster's own units.
 */
class RasterSource {
public:
    /**
     * @brief Result of a batch lookup
     *
     * values[i] is meaningful only where valid[i] is non-zero. A sample is
     * invalid when it falls outside the raster, on a nodata pixel or on NaN.
     */
    struct Samples {
        std::vector<double> values;
        std::vector<std::uint8_t> valid;
        size_t valid_count = 0;
    };

    /**
     * @brief Build from an in-memory band
     * @param identifier Name used in log messages
     * @param data Row-major band values, width * height entries
     * @param geotransform GDAL affine transform (origin x, pixel w, rot, origin y, rot, pixel h)
     * @param crs_wkt Projected CRS of the geotransform; empty for geographic lon/lat
     * @throws DataUnavailableError if the sizes disagree, the transform is not
     *         invertible or crs_wkt cannot be used
     */
    RasterSource(std::string identifier, std::vector<double> data,
                 size_t width, size_t height,
                 const std::array<double, 6>& geotransform,
                 std::optional<double> nodata = std::nullopt,
                 std::string crs_wkt = {});

    /**
     * @brief Decode band 1 of a GDAL-readable raster
     *
     * With a window only the pixels covering it are read; a window that misses
     * the raster yields an empty source whose samples are all invalid.
     *
     * @throws DataUnavailableError if the file cannot be opened or read
     */
    static RasterSource open(const std::string& path,
                             const std::optional<BoundingBox>& window = std::nullopt);

    Samples sample(const std::vector<GeoPoint>& points) const;
    std::optional<double> sample_at(const GeoPoint& point) const;

    /// Flat pixel index for a lon/lat point, or -1 outside the raster
    long long pixel_index(const GeoPoint& point) const;

    const std::string& identifier() const { return identifier_; }
    const std::vector<double>& data() const { return data_; }
    size_t width() const { return width_; }
    size_t height() const { return height_; }
    const std::array<double, 6>& geotransform() const { return geotransform_; }
    const std::array<double, 6>& inverse_geotransform() const { return inverse_geotransform_; }
    std::optional<double> nodata() const { return nodata_; }
    const std::string& crs_wkt() const { return crs_wkt_; }
    bool is_projected() const { return !crs_wkt_.empty(); }

    /// Extent in the raster's own CRS
    BoundingBox bounds() const;
    bool empty() const { return data_.empty(); }

private:
    std::string identifier_;
    std::vector<double> data_;
    size_t width_ = 0;
    size_t height_ = 0;
    std::array<double, 6> geotransform_{};
    std::array<double, 6> inverse_geotransform_{};
    std::optional<double> nodata_;
    std::string crs_wkt_;

    bool is_valid_value(double value) const;
    long long pixel_index_xy(double x, double y) const;

    /// Points in raster CRS units; NaN where the transformation fails
    void to_raster_crs(const std::vector<GeoPoint>& points, std::vector<double>& xs, std::vector<double>& ys) const;
};

} // namespace rfprof
