/**
 * @file GeoJSONExporter.cpp
 * @brief Implementation of GeoJSON export
 */

#include "GeoJSONExporter.hpp"
#include "../core/JsonSerialization.hpp"
#include "../core/Logger.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace rfprof {

GeoJSONExporter::GeoJSONExporter()
    : options_() {}

GeoJSONExporter::GeoJSONExporter(const Options& options)
    : options_(options) {}

bool GeoJSONExporter::export_geojson(const std::vector<EnrichedPoint>& points, const std::string& filename) {
    Logger logger("GeoJSONExporter");

    try {
        write_text_atomic(filename, to_geojson_string(points));
    } catch (const std::exception& e) {
        logger.error("Failed to create GeoJSON file: " + filename + " (" + e.what() + ")");
        return false;
    }

    logger.info("Exported GeoJSON: " + filename + " (" + std::to_string(points.size()) + " points)");
    return true;
}

std::string GeoJSONExporter::to_geojson_string(const std::vector<EnrichedPoint>& points) const {
    std::ostringstream json;
    const char* nl = options_.pretty_print ? "\n  " : "";

    json << "{" << nl;
    json << "\"type\": \"FeatureCollection\"," << nl;

    if (options_.include_crs) {
        json << "\"crs\": {\"type\": \"name\", \"properties\": {\"name\": \"" << options_.crs << "\"}}," << nl;
    }

    json << "\"features\": [";
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0) json << ",";
        if (options_.pretty_print) json << "\n    ";
        json << point_to_geojson(points[i]);
    }
    if (options_.pretty_print) json << "\n  ";
    json << "]";
    if (options_.pretty_print) json << "\n";
    json << "}\n";

    return json.str();
}

std::string GeoJSONExporter::point_to_geojson(const EnrichedPoint& point) const {
    std::ostringstream json;
    json << "{\"type\": \"Feature\", ";

    if (options_.include_properties) {
        json << "\"properties\": " << create_properties(point) << ", ";
    }

    json << "\"geometry\": {\"type\": \"Point\", \"coordinates\": ["
         << format_coordinate(point.point.position.lon) << ", "
         << format_coordinate(point.point.position.lat) << "]}}";
    return json.str();
}

std::string GeoJSONExporter::create_properties(const EnrichedPoint& point) const {
    std::ostringstream json;
    json << "{";
    json << "\"rx_id\": " << point.point.id;
    json << ", \"distance_km\": " << format_number(point.point.distance_km);
    json << ", \"azimuth_deg\": ";
    if (point.point.has_azimuth) {
        json << format_number(point.point.azimuth_deg);
    } else {
        json << "null";
    }
    json << ", \"h\": " << format_number(point.elevation_m);
    json << ", \"lc_code\": " << point.land_cover_code;
    json << ", \"Ct\": " << point.category;
    json << ", \"R\": " << format_number(point.roughness_m);
    json << ", \"zone\": " << point.zone;

    if (options_.include_fallback_flags) {
        json << ", \"elevation_fallback\": " << (point.elevation_fallback ? "true" : "false");
        json << ", \"land_cover_fallback\": " << (point.land_cover_fallback ? "true" : "false");
        json << ", \"zone_fallback\": " << (point.zone_fallback ? "true" : "false");
    }
    json << "}";
    return json.str();
}

std::string GeoJSONExporter::format_coordinate(double value) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(options_.precision) << value;
    return oss.str();
}

std::string GeoJSONExporter::format_number(double value) const {
    // JSON has no NaN or Infinity
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

} // namespace rfprof
