/**
 * @file LandCoverProvider.hpp
 * @brief Sources of the land-cover raster chip centred on the transmitter
 */

#pragma once

#include "rf_profile_generator.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace rfprof {

struct LandCoverRequest {
    double lat = 0.0;
    double lon = 0.0;
    int year = 2020;
    double buffer_m = 11000.0;
    int chip_px = 734;
    bool force_download = false;  ///< Ignore a cached chip and fetch again
};

/// Geographic extent of a request: +/- buffer_m around the centre
BoundingBox land_cover_bounds(const LandCoverRequest& request);

/// Cache file name, e.g. "lcm10_9.345_-13.40694_2020_buf11000m_734px.tif"
std::string land_cover_cache_name(const LandCoverRequest& request);

/**
 * @brief Supplies a georeferenced land-cover raster for a request
 *
 * Implementations must return a readable raster path or throw
 * DataUnavailableError. Repeated calls with the same request should be served
 * from the provider's own cache unless the request sets force_download.
 */
class LandCoverProvider {
public:
    virtual ~LandCoverProvider() = default;

    virtual std::string fetch_or_cache(const LandCoverRequest& request) = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief A land-cover raster that already exists on disk
 */
class FileLandCoverProvider : public LandCoverProvider {
public:
    explicit FileLandCoverProvider(std::string path);

    std::string fetch_or_cache(const LandCoverRequest& request) override;
    std::string name() const override { return "file"; }

private:
    std::string path_;
};

/**
 * @brief Sentinel Hub Process API client for a BYOC land-cover collection
 *
 * Uses the OAuth2 client-credentials grant; the access token is reused until
 * 60 seconds before its expiry. Chips are cached under cache_dir by request.
 */
class SentinelHubLandCoverProvider : public LandCoverProvider {
public:
    SentinelHubLandCoverProvider(const LandCoverConfig& config, int max_retries);

    std::string fetch_or_cache(const LandCoverRequest& request) override;
    std::string name() const override { return "sentinel-hub"; }

    /// Process API request body for a request
    std::string build_process_request(const LandCoverRequest& request) const;

private:
    LandCoverConfig config_;
    HttpClient client_;
    Logger logger_{"LandCover"};

    std::mutex token_mutex_;
    std::string token_;
    std::chrono::steady_clock::time_point token_expiry_;

    std::string access_token();
    void georeference(const std::string& path, const BoundingBox& bounds, int chip_px) const;
};

/**
 * @brief Provider selected by LandCoverConfig::provider
 * @throws ConfigurationError for an unknown provider name
 */
std::shared_ptr<LandCoverProvider> make_land_cover_provider(const LandCoverConfig& config, int max_retries);

} // namespace rfprof
