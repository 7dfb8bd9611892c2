/**
 * @file GeoJSONExporter.hpp
 * @brief GeoJSON vector export for enriched receiver points
 *
 * Exports the extraction result as a GeoJSON FeatureCollection of points
 * for inspection in web mapping applications and GIS software.
 */

#pragma once

#include "rf_profile_generator.hpp"
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Exports enriched points as GeoJSON
 *
 * Each point becomes a Feature carrying its id, distance, azimuth (null for the
 * transmitter), sampled attributes and fallback flags as properties.
 */
class GeoJSONExporter {
public:
    struct Options {
        bool pretty_print;
        bool include_properties;
        bool include_fallback_flags;
        int precision;
        std::string crs;
        bool include_crs;

        Options()
            : pretty_print(false),
              include_properties(true),
              include_fallback_flags(true),
              precision(8),
              crs("EPSG:4326"),
              include_crs(true) {}
    };

    GeoJSONExporter();
    explicit GeoJSONExporter(const Options& options);

    /**
     * @brief Export points as GeoJSON FeatureCollection
     * @param points Enriched points to export
     * @param filename Output GeoJSON filename
     * @return true if export succeeded
     */
    bool export_geojson(const std::vector<EnrichedPoint>& points, const std::string& filename);

    /**
     * @brief Generate GeoJSON string (without writing to file)
     */
    std::string to_geojson_string(const std::vector<EnrichedPoint>& points) const;

private:
    Options options_;

    std::string point_to_geojson(const EnrichedPoint& point) const;
    std::string create_properties(const EnrichedPoint& point) const;

    // Formatting helpers
    std::string format_coordinate(double value) const;
    std::string format_number(double value) const;
};

} // namespace rfprof
