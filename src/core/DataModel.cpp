/**
 * @file DataModel.cpp
 * @brief Shared value types: bounding boxes, code tables, phase names, reports
 */

#include "rf_profile_generator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace rfprof {

namespace {
    constexpr double METERS_PER_DEGREE = 111320.0;
    constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
}

BoundingBox BoundingBox::around(const GeoPoint& centre, double radius_m) {
    double dlat = radius_m / METERS_PER_DEGREE;
    double dlon = radius_m / (METERS_PER_DEGREE * std::cos(centre.lat * DEG_TO_RAD));
    return BoundingBox(centre.lon - dlon, centre.lat - dlat, centre.lon + dlon, centre.lat + dlat);
}

BoundingBox BoundingBox::covering(const std::vector<GeoPoint>& points) {
    if (points.empty()) {
        return BoundingBox();
    }
    BoundingBox box(points.front().lon, points.front().lat, points.front().lon, points.front().lat);
    for (const auto& point : points) {
        box.expand(point);
    }
    return box;
}

// ============================================================================
// ExtractionReport
// ============================================================================

ExtractionReport& ExtractionReport::operator+=(const ExtractionReport& other) {
    total_points += other.total_points;
    elevation_missing += other.elevation_missing;
    elevation_out_of_range += other.elevation_out_of_range;
    land_cover_missing += other.land_cover_missing;
    land_cover_unmapped += other.land_cover_unmapped;
    zone_fallbacks += other.zone_fallbacks;
    zone_defaults += other.zone_defaults;
    return *this;
}

std::string ExtractionReport::summary() const {
    std::ostringstream oss;
    oss << total_points << " points extracted";
    if (elevation_missing > 0) {
        oss << "\n  " << elevation_missing << " points used fallback elevation (no data)";
    }
    if (elevation_out_of_range > 0) {
        oss << "\n  " << elevation_out_of_range << " points used fallback elevation (out of range)";
    }
    if (land_cover_missing > 0) {
        oss << "\n  " << land_cover_missing << " points had no land-cover sample";
    }
    if (land_cover_unmapped > 0) {
        oss << "\n  " << land_cover_unmapped << " points had an unmapped land-cover code";
    }
    if (zone_fallbacks > 0) {
        oss << "\n  " << zone_fallbacks << " points were assigned the nearest zone polygon";
    }
    if (zone_defaults > 0) {
        oss << "\n  " << zone_defaults << " points received the default zone";
    }
    return oss.str();
}

// ============================================================================
// LandCoverTables
// ============================================================================

int LandCoverTables::category_for(int code, bool* mapped) const {
    auto it = code_to_category.find(code);
    if (mapped) {
        *mapped = it != code_to_category.end();
    }
    return it != code_to_category.end() ? it->second : default_category;
}

double LandCoverTables::roughness_for(int category) const {
    auto it = category_to_roughness.find(category);
    return it != category_to_roughness.end() ? it->second : default_roughness;
}

LandCoverTables LandCoverTables::defaults() {
    LandCoverTables tables;
    // P.1812 clutter categories: 1 water/sea, 2 open/rural, 3 suburban,
    // 4 urban/trees/forest, 5 dense urban
    tables.code_to_category = {
        {10, 4},   // tree cover
        {20, 2},   // shrubland
        {30, 2},   // grassland
        {40, 2},   // cropland
        {50, 3},   // built-up
        {60, 2},   // bare / sparse vegetation
        {70, 2},   // snow and ice
        {80, 1},   // permanent water bodies
        {90, 1},   // herbaceous wetland
        {95, 4},   // mangroves
        {100, 2},  // moss and lichen
    };
    tables.category_to_roughness = {
        {1, 0.0},
        {2, 0.0},
        {3, 10.0},
        {4, 15.0},
        {5, 20.0},
    };
    tables.default_category = 2;
    tables.default_roughness = 0.0;
    return tables;
}

// ============================================================================
// Phases
// ============================================================================

std::string phase_name(Phase phase) {
    switch (phase) {
        case Phase::SETUP: return "Setup";
        case Phase::DATA_PREP: return "DataPrep";
        case Phase::POINT_GENERATION: return "PointGeneration";
        case Phase::EXTRACTION: return "Extraction";
        case Phase::EXPORT: return "Export";
    }
    return "Unknown";
}

std::optional<Phase> parse_phase(const std::string& name) {
    std::string key;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    for (Phase phase : ALL_PHASES) {
        std::string candidate = phase_name(phase);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == key) {
            return phase;
        }
    }
    return std::nullopt;
}

// ============================================================================
// ReceiverGenerationConfig
// ============================================================================

std::vector<double> ReceiverGenerationConfig::resolved_azimuths() const {
    if (!azimuths_deg.empty()) {
        return azimuths_deg;
    }

    std::vector<double> azimuths;
    if (num_azimuths <= 0) {
        return azimuths;
    }
    azimuths.reserve(static_cast<size_t>(num_azimuths));
    for (int i = 0; i < num_azimuths; ++i) {
        azimuths.push_back(i * 360.0 / num_azimuths);
    }
    return azimuths;
}

} // namespace rfprof
