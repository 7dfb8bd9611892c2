/**
 * @file TerrainTileCache.hpp
 * @brief Local 1-degree DEM tile cache with optional download and VRT mosaicking
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "rf_profile_generator.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Resolves the DEM tiles covering a bounding box
 *
 * A tile is looked up in the cache directory as NxxEyyy.hgt, then .tif, then
 * .hgt.gz (decompressed next to it). With download_missing enabled, absent
 * tiles are fetched from base_url/Nxx/NxxEyyy.hgt.gz. Tiles that remain
 * absent are reported, not fatal; ocean tiles legitimately do not exist.
 * An archive newer than its extracted .hgt is extracted again. force_download
 * re-fetches every tile (when downloads are enabled) and re-extracts every
 * cached .hgt.gz archive.
 */
class TerrainTileCache {
public:
    struct Config {
        std::string cache_directory = "data/input/dem_tiles";
        std::string base_url = "https://s3.amazonaws.com/elevation-tiles-prod/skadi";
        bool download_missing = false;
        bool force_download = false;
        int timeout_seconds = 60;
        int max_retries = 3;
    };

    struct Coverage {
        std::vector<std::string> tile_paths;
        std::vector<std::string> missing_tiles;

        bool complete() const { return missing_tiles.empty(); }
    };

    explicit TerrainTileCache(const Config& config);

    Coverage collect_tiles(const BoundingBox& bounds) const;

    /**
     * @brief Tile base name for the cell containing a coordinate
     * @return e.g. "N09W014" for (9.345, -13.40694)
     */
    static std::string tile_name(double lat, double lon);

    /// Tile names covering bounds, splitting at the antimeridian
    static std::vector<std::string> required_tiles(const BoundingBox& bounds);

    /**
     * @brief Mosaic tiles into one virtual raster
     * @throws DataUnavailableError when no tile is given or GDAL fails
     */
    static void build_mosaic(const std::vector<std::string>& tile_paths, const std::string& vrt_path);

    /// True when any tile file for name (.hgt, .tif or .hgt.gz) is in the cache directory
    bool has_local(const std::string& name) const;

    static bool decompress_gzip_file(const std::filesystem::path& gz_path, const std::filesystem::path& output_path,
                                     bool overwrite = false);

private:
    Config config_;
    Logger logger_{"TerrainTileCache"};

    std::optional<std::filesystem::path> find_local(const std::string& name) const;
    std::optional<std::filesystem::path> download_tile(const std::string& name) const;

    static bool has_gzip_magic(const std::filesystem::path& path);
    static std::vector<BoundingBox> split_antimeridian_bounds(const BoundingBox& bounds);
};

} // namespace rfprof
