#pragma once

/**
 * @file rf_profile_generator.hpp
 * @brief Main header for the RF Profile Generator
 *
 * Batch geospatial sampling engine that turns a transmitter location into
 * terrain, land-cover and radio-climatic-zone enriched receiver profiles
 * for ITU-R P.1812 style path loss models.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace rfprof {

// ============================================================================
// Geographic primitives
// ============================================================================

/**
 * @brief WGS84 position in decimal degrees
 */
struct GeoPoint {
    double lon = 0.0;
    double lat = 0.0;

    GeoPoint() = default;
    GeoPoint(double longitude, double latitude) : lon(longitude), lat(latitude) {}

    bool operator==(const GeoPoint&) const = default;
};

/**
 * @brief Axis-aligned geographic bounding box (min_x/max_x are longitudes)
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool contains(const GeoPoint& point) const {
        return point.lon >= min_x && point.lon <= max_x &&
               point.lat >= min_y && point.lat <= max_y;
    }

    bool intersects(const BoundingBox& other) const {
        return min_x <= other.max_x && max_x >= other.min_x &&
               min_y <= other.max_y && max_y >= other.min_y;
    }

    void expand(const GeoPoint& point) {
        min_x = std::min(min_x, point.lon);
        max_x = std::max(max_x, point.lon);
        min_y = std::min(min_y, point.lat);
        max_y = std::max(max_y, point.lat);
    }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }

    /// Box of +/- radius_m around a centre, using 111320 m per degree of latitude
    static BoundingBox around(const GeoPoint& centre, double radius_m);

    /// Smallest box covering all points (degenerate box for a single point)
    static BoundingBox covering(const std::vector<GeoPoint>& points);
};

// ============================================================================
// Run entities
// ============================================================================

/**
 * @brief Transmitter site and the radio parameters of the link
 */
struct Transmitter {
    std::string id = "TX_0001";
    double longitude = -13.40694;
    double latitude = 9.345;
    double antenna_height_m = 10.0;   ///< htg, transmitter antenna above ground
    double receiver_height_m = 10.0;  ///< hrg, receiver antenna above ground
    double frequency_ghz = 0.9;
    int polarization = 1;             ///< 1 = horizontal, 2 = vertical
    double time_percentage = 50.0;

    GeoPoint position() const { return {longitude, latitude}; }
};

/**
 * @brief One generated sample location
 *
 * The transmitter itself is the single point with id 0, distance 0 and no azimuth.
 */
struct ReceiverPoint {
    int id = 0;
    double distance_km = 0.0;
    double azimuth_deg = 0.0;
    bool has_azimuth = false;
    GeoPoint position;

    bool is_transmitter() const { return !has_azimuth; }
    bool operator==(const ReceiverPoint&) const = default;
};

/**
 * @brief Receiver point extended with the sampled terrain attributes
 */
struct EnrichedPoint {
    ReceiverPoint point;
    double elevation_m = 0.0;
    int land_cover_code = 0;
    int category = 0;
    double roughness_m = 0.0;
    int zone = 0;

    bool elevation_fallback = false;
    bool land_cover_fallback = false;
    bool zone_fallback = false;

    bool operator==(const EnrichedPoint&) const = default;
};

/**
 * @brief Anomaly counters gathered during one extraction batch
 */
struct ExtractionReport {
    size_t total_points = 0;
    size_t elevation_missing = 0;       ///< nodata pixel, outside mosaic or no mosaic
    size_t elevation_out_of_range = 0;  ///< sampled but outside the admissible range
    size_t land_cover_missing = 0;      ///< nodata pixel or outside the land-cover raster
    size_t land_cover_unmapped = 0;     ///< raw code absent from the category table
    size_t zone_fallbacks = 0;          ///< resolved by nearest polygon
    size_t zone_defaults = 0;           ///< no polygon set, default zone applied

    size_t elevation_fallbacks() const { return elevation_missing + elevation_out_of_range; }
    bool has_anomalies() const {
        return elevation_fallbacks() > 0 || land_cover_missing > 0 ||
               land_cover_unmapped > 0 || zone_fallbacks > 0;
    }

    ExtractionReport& operator+=(const ExtractionReport& other);
    bool operator==(const ExtractionReport&) const = default;

    /// Human readable one-line-per-anomaly summary
    std::string summary() const;
};

/**
 * @brief Per-azimuth path profile handed to the propagation model
 *
 * Index i of every array refers to the same physical point.
 */
struct Profile {
    double frequency_ghz = 0.0;
    double time_percentage = 0.0;
    std::vector<double> distances_km;
    std::vector<int> heights_m;
    std::vector<double> roughness_m;
    std::vector<int> categories;
    std::vector<int> zones;
    double tx_height_m = 0.0;
    double rx_height_m = 0.0;
    int polarization = 1;
    double phi_t = 0.0;  ///< transmitter latitude
    double lam_t = 0.0;  ///< transmitter longitude
    double phi_r = 0.0;  ///< receiver (profile end) latitude
    double lam_r = 0.0;  ///< receiver (profile end) longitude
    double azimuth_deg = 0.0;

    size_t size() const { return distances_km.size(); }
};

// ============================================================================
// Land cover code tables
// ============================================================================

/**
 * @brief Raw land-cover code -> P.1812 clutter category -> roughness (m)
 */
struct LandCoverTables {
    std::map<int, int> code_to_category;
    std::map<int, double> category_to_roughness;
    int default_category = 2;
    double default_roughness = 0.0;

    int category_for(int code, bool* mapped = nullptr) const;
    double roughness_for(int category) const;

    /// ESA WorldCover style codes mapped onto the five P.1812 categories
    static LandCoverTables defaults();
};

// ============================================================================
// Pipeline phases
// ============================================================================

enum class Phase {
    SETUP = 0,
    DATA_PREP = 1,
    POINT_GENERATION = 2,
    EXTRACTION = 3,
    EXPORT = 4
};

constexpr Phase ALL_PHASES[] = {
    Phase::SETUP, Phase::DATA_PREP, Phase::POINT_GENERATION, Phase::EXTRACTION, Phase::EXPORT
};

std::string phase_name(Phase phase);

/// Accepts the phase name in any letter case, with or without separators
std::optional<Phase> parse_phase(const std::string& name);

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Receiver point generation parameters
 *
 * An explicit azimuth list takes precedence over num_azimuths.
 */
struct ReceiverGenerationConfig {
    double max_distance_km = 11.0;
    double distance_step_km = 0.03;
    int num_azimuths = 36;
    std::vector<double> azimuths_deg;

    std::vector<double> resolved_azimuths() const;
};

struct ElevationConfig {
    std::string tile_cache_dir = "data/input/dem_tiles";
    double min_m = -500.0;
    double max_m = 9000.0;
    double fallback_m = 0.0;
    double margin_km = 1.0;  ///< extra coverage beyond max_distance_km
    bool download_missing = false;
    std::string base_url = "https://s3.amazonaws.com/elevation-tiles-prod/skadi";
    int timeout_seconds = 60;
};

struct LandCoverConfig {
    std::string provider = "file";  ///< "file" or "sentinel-hub"
    std::string path;               ///< raster for the file provider
    std::string cache_dir = "data/input/landcover";
    int year = 2020;
    double buffer_m = 11000.0;
    int chip_px = 734;
    int nodata_code = 254;
    bool required = true;

    std::string token_url =
        "https://identity.dataspace.copernicus.eu/auth/realms/CDSE/protocol/openid-connect/token";
    std::string process_url = "https://sh.dataspace.copernicus.eu/api/v1/process";
    std::string collection_id;
    std::string client_id_env = "SH_CLIENT_ID";
    std::string client_secret_env = "SH_CLIENT_SECRET";
    int timeout_seconds = 300;
};

struct ZoneConfig {
    std::string path;  ///< empty: every point receives default_zone
    std::string id_field = "zone_type_id";
    int default_zone = 4;  ///< inland
};

struct PipelineSettings {
    std::string project_root = ".";
    std::string cache_dir = "data/cache";
    std::string output_dir = "data/output";
    std::string base_name = "profiles";
    int num_threads = 1;
    bool include_transmitter_in_profiles = true;
    int max_retries = 3;
    std::set<Phase> force_refresh;
    std::optional<Phase> run_until;

    int log_level = 3;
    std::optional<std::string> log_file;
};

/**
 * @brief Complete, statically typed run configuration
 */
struct PipelineConfig {
    Transmitter transmitter;
    ReceiverGenerationConfig generation;
    ElevationConfig elevation;
    LandCoverConfig landcover;
    LandCoverTables tables = LandCoverTables::defaults();
    ZoneConfig zones;
    PipelineSettings pipeline;
    std::optional<std::string> config_file;
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Invalid run parameters, raised before any work begins
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/**
 * @brief A required raster or polygon dataset could not be obtained
 */
class DataUnavailableError : public std::runtime_error {
public:
    explicit DataUnavailableError(const std::string& message)
        : std::runtime_error("Data unavailable: " + message) {}
};

/**
 * @brief Fatal failure of one pipeline phase
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(Phase phase, const std::string& cause)
        : std::runtime_error("Phase " + phase_name(phase) + " failed: " + cause), phase_(phase) {}

    Phase phase() const { return phase_; }

private:
    Phase phase_;
};

// ============================================================================
// Pipeline orchestration
// ============================================================================

/**
 * @brief Summary of a finished phase, as returned to callers of a run
 */
struct PhaseOutcome {
    Phase phase = Phase::SETUP;
    bool from_cache = false;
    std::string fingerprint;
    std::string artifact;
    long long duration_ms = 0;
};

struct RunResult {
    std::vector<PhaseOutcome> outcomes;
    ExtractionReport report;
    std::string profiles_csv;
    std::string points_geojson;
    size_t profile_count = 0;

    bool executed(Phase phase) const;
    bool from_cache(Phase phase) const;
};

class LandCoverProvider;

/**
 * @brief Resumable phase state machine
 *
 * Setup -> DataPrep -> PointGeneration -> Extraction -> Export. Each phase is
 * fingerprinted; a phase whose cache entry matches and whose artifact is intact
 * is skipped. DataPrep runs concurrently with PointGeneration.
 */
class PipelineOrchestrator {
public:
    explicit PipelineOrchestrator(const PipelineConfig& config);
    PipelineOrchestrator(const PipelineConfig& config, std::shared_ptr<LandCoverProvider> provider);
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /**
     * @brief Execute every phase up to pipeline.run_until (or Export)
     * @throws PipelineError naming the failed phase
     */
    RunResult run();

    const PipelineConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rfprof
