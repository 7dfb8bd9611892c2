/**
 * @file TerrainTileCache.cpp
 * @brief Implementation of the DEM tile cache
 */

#include "TerrainTileCache.hpp"
#include "HttpClient.hpp"
#include <gdal_priv.h>
#include <gdal_utils.h>
#include <cpl_string.h>
#include <zlib.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <memory>
#include <set>
#include <sstream>

namespace rfprof {

namespace {
    struct GDALDatasetDeleter {
        void operator()(GDALDatasetH dataset) const {
            if (dataset) GDALClose(dataset);
        }
    };
    using GDALHandlePtr = std::unique_ptr<void, GDALDatasetDeleter>;
}

TerrainTileCache::TerrainTileCache(const Config& config) : config_(config) {}

std::string TerrainTileCache::tile_name(double lat, double lon) {
    int ilat = static_cast<int>(std::floor(lat));
    int ilon = static_cast<int>(std::floor(lon));
    // The eastern and northern edges belong to the last tile
    ilat = std::clamp(ilat, -90, 89);
    ilon = std::clamp(ilon, -180, 179);

    std::ostringstream ss;
    ss << (ilat >= 0 ? "N" : "S") << std::setfill('0') << std::setw(2) << std::abs(ilat)
       << (ilon >= 0 ? "E" : "W") << std::setfill('0') << std::setw(3) << std::abs(ilon);
    return ss.str();
}

std::vector<BoundingBox> TerrainTileCache::split_antimeridian_bounds(const BoundingBox& bounds) {
    std::vector<BoundingBox> result;
    if (bounds.min_x < -180.0) {
        result.emplace_back(bounds.min_x + 360.0, bounds.min_y, 180.0, bounds.max_y);
        result.emplace_back(-180.0, bounds.min_y, bounds.max_x, bounds.max_y);
    } else if (bounds.max_x > 180.0) {
        result.emplace_back(bounds.min_x, bounds.min_y, 180.0, bounds.max_y);
        result.emplace_back(-180.0, bounds.min_y, bounds.max_x - 360.0, bounds.max_y);
    } else if (bounds.min_x > bounds.max_x) {
        result.emplace_back(bounds.min_x, bounds.min_y, 180.0, bounds.max_y);
        result.emplace_back(-180.0, bounds.min_y, bounds.max_x, bounds.max_y);
    } else {
        result.push_back(bounds);
    }
    return result;
}

std::vector<std::string> TerrainTileCache::required_tiles(const BoundingBox& bounds) {
    std::vector<std::string> names;
    std::set<std::string> seen;

    for (const auto& bbox : split_antimeridian_bounds(bounds)) {
        int lat_min = static_cast<int>(std::floor(bbox.min_y));
        int lat_max = static_cast<int>(std::floor(bbox.max_y));
        int lon_min = static_cast<int>(std::floor(bbox.min_x));
        int lon_max = static_cast<int>(std::floor(bbox.max_x));

        for (int lat = lat_min; lat <= lat_max; ++lat) {
            for (int lon = lon_min; lon <= lon_max; ++lon) {
                std::string name = tile_name(lat, lon);
                if (seen.insert(name).second) {
                    names.push_back(name);
                }
            }
        }
    }
    return names;
}

TerrainTileCache::Coverage TerrainTileCache::collect_tiles(const BoundingBox& bounds) const {
    Coverage coverage;
    auto names = required_tiles(bounds);
    logger_.info("Resolving " + std::to_string(names.size()) + " DEM tiles in " + config_.cache_directory);

    for (const auto& name : names) {
        std::optional<std::filesystem::path> local;
        if (config_.force_download && config_.download_missing) {
            local = download_tile(name);
        }
        if (!local) {
            local = find_local(name);
        }
        if (!local && config_.download_missing && !config_.force_download) {
            local = download_tile(name);
        }

        if (local) {
            logger_.debug("Using tile: " + local->string());
            coverage.tile_paths.push_back(local->string());
        } else {
            coverage.missing_tiles.push_back(name);
        }
    }

    if (!coverage.missing_tiles.empty()) {
        std::string list;
        for (const auto& name : coverage.missing_tiles) {
            list += (list.empty() ? "" : ", ") + name;
        }
        logger_.warning("No DEM data for " + std::to_string(coverage.missing_tiles.size()) +
                        " tile(s): " + list + "; affected points use the elevation fallback");
    }
    return coverage;
}

std::optional<std::filesystem::path> TerrainTileCache::find_local(const std::string& name) const {
    const std::filesystem::path dir(config_.cache_directory);

    auto gz_path = dir / (name + ".hgt.gz");
    auto hgt_path = dir / (name + ".hgt");
    if (std::filesystem::exists(gz_path)) {
        // Re-extract over a stale .hgt when forced or when the archive was replaced
        std::error_code ec;
        auto hgt_time = std::filesystem::last_write_time(hgt_path, ec);
        bool stale = !ec && std::filesystem::last_write_time(gz_path) > hgt_time;
        if (decompress_gzip_file(gz_path, hgt_path, config_.force_download || stale)) {
            return hgt_path;
        }
        logger_.warning("Cached tile " + gz_path.string() + " could not be decompressed");
    }

    for (const auto& candidate : {hgt_path, dir / (name + ".tif")}) {
        if (std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool TerrainTileCache::has_local(const std::string& name) const {
    const std::filesystem::path dir(config_.cache_directory);
    for (const char* extension : {".hgt", ".tif", ".hgt.gz"}) {
        if (std::filesystem::exists(dir / (name + extension))) {
            return true;
        }
    }
    return false;
}

std::optional<std::filesystem::path> TerrainTileCache::download_tile(const std::string& name) const {
    // Latitude prefix is the subdirectory, e.g. "N09" for "N09W014"
    std::string url = config_.base_url + "/" + name.substr(0, 3) + "/" + name + ".hgt.gz";
    auto gz_path = std::filesystem::path(config_.cache_directory) / (name + ".hgt.gz");

    HttpClient::Config http_config;
    http_config.timeout_seconds = config_.timeout_seconds;
    http_config.max_retries = config_.max_retries;
    HttpClient client(http_config);

    logger_.info("Downloading tile: " + url);
    if (!client.download_to_file(url, gz_path)) {
        logger_.warning("Failed to download tile: " + name);
        return std::nullopt;
    }

    if (!has_gzip_magic(gz_path)) {
        logger_.error("Downloaded tile failed validation: " + name);
        std::error_code ec;
        std::filesystem::remove(gz_path, ec);
        return std::nullopt;
    }

    auto hgt_path = std::filesystem::path(config_.cache_directory) / (name + ".hgt");
    if (!decompress_gzip_file(gz_path, hgt_path, true)) {
        logger_.error("Failed to decompress: " + gz_path.string());
        return std::nullopt;
    }
    return hgt_path;
}

bool TerrainTileCache::has_gzip_magic(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    unsigned char magic[2] = {0, 0};
    file.read(reinterpret_cast<char*>(magic), 2);
    return file.gcount() == 2 && magic[0] == 0x1f && magic[1] == 0x8b;
}

bool TerrainTileCache::decompress_gzip_file(const std::filesystem::path& gz_path,
                                            const std::filesystem::path& output_path, bool overwrite) {
    if (!overwrite && std::filesystem::exists(output_path)) {
        return true;
    }

    gzFile gz_file = gzopen(gz_path.string().c_str(), "rb");
    if (!gz_file) {
        return false;
    }

    auto partial = output_path;
    partial += ".part";
    std::ofstream output_file(partial, std::ios::binary | std::ios::trunc);
    if (!output_file.is_open()) {
        gzclose(gz_file);
        return false;
    }

    char buffer[8192];
    int bytes_read;
    while ((bytes_read = gzread(gz_file, buffer, sizeof(buffer))) > 0) {
        output_file.write(buffer, bytes_read);
    }
    gzclose(gz_file);
    output_file.close();

    std::error_code ec;
    if (bytes_read < 0 || !output_file) {
        std::filesystem::remove(partial, ec);
        return false;
    }
    std::filesystem::rename(partial, output_path, ec);
    return !ec;
}

void TerrainTileCache::build_mosaic(const std::vector<std::string>& tile_paths, const std::string& vrt_path) {
    if (tile_paths.empty()) {
        throw DataUnavailableError("no DEM tiles available to build " + vrt_path);
    }

    GDALAllRegister();
    std::filesystem::create_directories(std::filesystem::path(vrt_path).parent_path());
    std::error_code ec;
    std::filesystem::remove(vrt_path, ec);

    char** input_filenames = nullptr;
    for (const auto& file : tile_paths) {
        input_filenames = CSLAddString(input_filenames, std::filesystem::absolute(file).string().c_str());
    }

    GDALBuildVRTOptions* build_options = GDALBuildVRTOptionsNew(nullptr, nullptr);
    int usage_error = FALSE;
    GDALHandlePtr vrt_dataset(GDALBuildVRT(vrt_path.c_str(), static_cast<int>(tile_paths.size()), nullptr,
                                           const_cast<const char**>(input_filenames), build_options,
                                           &usage_error));
    GDALBuildVRTOptionsFree(build_options);
    CSLDestroy(input_filenames);

    if (!vrt_dataset || usage_error) {
        throw DataUnavailableError("failed to build DEM mosaic " + vrt_path + ": " + CPLGetLastErrorMsg());
    }

    Logger logger("TerrainTileCache");
    logger.info("Built DEM mosaic " + vrt_path + " from " + std::to_string(tile_paths.size()) + " tile(s)");
}

} // namespace rfprof
