/**
 * @file LandCoverProvider.cpp
 * @brief File and Sentinel Hub land-cover providers
 */

#include "LandCoverProvider.hpp"
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace rfprof {

using json = nlohmann::json;

namespace {
    constexpr double METERS_PER_DEGREE = 111320.0;
    constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

    const char* EVALSCRIPT = R"(//VERSION=3
function setup() {
  return {
    input: ["LCM10"],
    output: { bands: 1, sampleType: "UINT8" }
  };
}
function evaluatePixel(s) {
  return [s.LCM10];
}
)";

    std::string getenv_or_empty(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        return value ? std::string(value) : std::string();
    }
}

BoundingBox land_cover_bounds(const LandCoverRequest& request) {
    double dlat = request.buffer_m / METERS_PER_DEGREE;
    double dlon = request.buffer_m / (METERS_PER_DEGREE * std::cos(request.lat * DEG_TO_RAD));
    return BoundingBox(request.lon - dlon, request.lat - dlat, request.lon + dlon, request.lat + dlat);
}

std::string land_cover_cache_name(const LandCoverRequest& request) {
    std::ostringstream ss;
    ss.precision(10);
    ss << "lcm10_" << request.lat << "_" << request.lon << "_" << request.year
       << "_buf" << static_cast<long long>(request.buffer_m) << "m_" << request.chip_px << "px.tif";
    return ss.str();
}

// ============================================================================
// FileLandCoverProvider
// ============================================================================

FileLandCoverProvider::FileLandCoverProvider(std::string path) : path_(std::move(path)) {}

std::string FileLandCoverProvider::fetch_or_cache(const LandCoverRequest&) {
    if (path_.empty()) {
        throw DataUnavailableError("no land-cover raster configured");
    }
    if (!std::filesystem::exists(path_)) {
        throw DataUnavailableError("land-cover raster not found: " + path_);
    }
    return path_;
}

// ============================================================================
// SentinelHubLandCoverProvider
// ============================================================================

SentinelHubLandCoverProvider::SentinelHubLandCoverProvider(const LandCoverConfig& config, int max_retries)
    : config_(config),
      client_(HttpClient::Config{config.timeout_seconds, max_retries, 1000, "rf-profile-gen/1.0"}) {}

std::string SentinelHubLandCoverProvider::access_token() {
    std::lock_guard<std::mutex> lock(token_mutex_);

    if (!token_.empty() && std::chrono::steady_clock::now() < token_expiry_) {
        logger_.debug("Reusing cached access token");
        return token_;
    }

    std::string client_id = getenv_or_empty(config_.client_id_env);
    std::string client_secret = getenv_or_empty(config_.client_secret_env);
    if (client_id.empty() || client_secret.empty()) {
        throw DataUnavailableError("Sentinel Hub credentials missing; set " + config_.client_id_env +
                                   " and " + config_.client_secret_env);
    }

    logger_.detailed("Requesting new token from " + config_.token_url);
    auto response = client_.post_form(config_.token_url, {
        {"grant_type", "client_credentials"},
        {"client_id", client_id},
        {"client_secret", client_secret},
    });
    if (!response.ok()) {
        throw DataUnavailableError("token request failed with HTTP " + std::to_string(response.status));
    }

    try {
        json data = json::parse(response.body);
        token_ = data.at("access_token").get<std::string>();
        int expires_in = data.value("expires_in", 3600);
        // Refresh 60s before expiry
        token_expiry_ = std::chrono::steady_clock::now() + std::chrono::seconds(expires_in - 60);
    } catch (const json::exception& e) {
        throw DataUnavailableError("malformed token response: " + std::string(e.what()));
    }
    return token_;
}

std::string SentinelHubLandCoverProvider::build_process_request(const LandCoverRequest& request) const {
    BoundingBox bbox = land_cover_bounds(request);
    std::string year = std::to_string(request.year);

    json body = {
        {"input", {
            {"bounds", {
                {"bbox", {bbox.min_x, bbox.min_y, bbox.max_x, bbox.max_y}},
                {"properties", {{"crs", "http://www.opengis.net/def/crs/EPSG/0/4326"}}},
            }},
            {"data", json::array({{
                {"type", "byoc-" + config_.collection_id},
                {"dataFilter", {{"timeRange", {
                    {"from", year + "-01-01T00:00:00Z"},
                    {"to", year + "-12-31T23:59:59Z"},
                }}}},
            }})},
        }},
        {"output", {
            {"width", request.chip_px},
            {"height", request.chip_px},
            {"responses", json::array({{
                {"identifier", "default"},
                {"format", {{"type", "image/tiff"}}},
            }})},
        }},
        {"evalscript", EVALSCRIPT},
    };
    return body.dump();
}

std::string SentinelHubLandCoverProvider::fetch_or_cache(const LandCoverRequest& request) {
    auto cache_path = std::filesystem::path(config_.cache_dir) / land_cover_cache_name(request);
    if (request.force_download) {
        logger_.info("Ignoring cached land cover, fetching again");
    } else if (std::filesystem::exists(cache_path)) {
        logger_.info("Using cached land cover: " + cache_path.string());
        return cache_path.string();
    }

    if (config_.collection_id.empty()) {
        throw DataUnavailableError("Sentinel Hub collection_id is not configured");
    }

    std::string token = access_token();
    logger_.info("Fetching land cover chip (" + std::to_string(request.chip_px) + " px, buffer " +
                 std::to_string(static_cast<long long>(request.buffer_m)) + " m)");

    auto response = client_.post(config_.process_url, build_process_request(request), {
        "Authorization: Bearer " + token,
        "Content-Type: application/json",
        "Accept: image/tiff",
    });
    if (!response.ok()) {
        throw DataUnavailableError("Process API request failed with HTTP " + std::to_string(response.status));
    }

    std::filesystem::create_directories(config_.cache_dir);
    auto partial = cache_path;
    partial += ".part";
    {
        std::ofstream file(partial, std::ios::binary | std::ios::trunc);
        file.write(response.body.data(), static_cast<std::streamsize>(response.body.size()));
        if (!file) {
            throw DataUnavailableError("cannot write land-cover chip " + partial.string());
        }
    }

    georeference(partial.string(), land_cover_bounds(request), request.chip_px);
    std::filesystem::rename(partial, cache_path);
    logger_.info("Cached land cover chip: " + cache_path.string());
    return cache_path.string();
}

void SentinelHubLandCoverProvider::georeference(const std::string& path, const BoundingBox& bounds,
                                                int chip_px) const {
    GDALAllRegister();
    GDALDataset* dataset = static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_Update));
    if (!dataset) {
        throw DataUnavailableError("Process API response is not a readable raster");
    }

    double gt[6] = {bounds.min_x, bounds.width() / chip_px, 0.0,
                    bounds.max_y, 0.0, -bounds.height() / chip_px};
    OGRSpatialReference wgs84;
    wgs84.SetWellKnownGeogCS("WGS84");

    bool ok = dataset->SetGeoTransform(gt) == CE_None && dataset->SetSpatialRef(&wgs84) == CE_None;
    GDALClose(dataset);
    if (!ok) {
        throw DataUnavailableError("cannot georeference land-cover chip " + path);
    }
}

std::shared_ptr<LandCoverProvider> make_land_cover_provider(const LandCoverConfig& config, int max_retries) {
    if (config.provider == "file") {
        return std::make_shared<FileLandCoverProvider>(config.path);
    }
    if (config.provider == "sentinel-hub") {
        return std::make_shared<SentinelHubLandCoverProvider>(config, max_retries);
    }
    throw ConfigurationError("unknown land-cover provider '" + config.provider + "'");
}

} // namespace rfprof
