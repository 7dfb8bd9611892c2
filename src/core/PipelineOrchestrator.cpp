/**
 * @file PipelineOrchestrator.cpp
 * @brief Phase state machine with fingerprinted, resumable phases
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "rf_profile_generator.hpp"
#include "ConfigValidator.hpp"
#include "Digest.hpp"
#include "ExecutionPolicies.hpp"
#include "Extractor.hpp"
#include "JsonSerialization.hpp"
#include "LandCoverProvider.hpp"
#include "Logger.hpp"
#include "PipelineCache.hpp"
#include "PointGenerator.hpp"
#include "RasterSource.hpp"
#include "RunTracker.hpp"
#include "TerrainTileCache.hpp"
#include "ZoneResolver.hpp"
#include "../export/GeoJSONExporter.hpp"
#include "../export/ProfileBuilder.hpp"
#include "../export/ProfileCsvExporter.hpp"
#include "version.h"
#include <exception>
#include <filesystem>
#include <functional>
#include <future>
#include <iomanip>
#include <sstream>

namespace rfprof {

namespace fs = std::filesystem;

bool RunResult::executed(Phase phase) const {
    for (const auto& outcome : outcomes) {
        if (outcome.phase == phase) return !outcome.from_cache;
    }
    return false;
}

bool RunResult::from_cache(Phase phase) const {
    for (const auto& outcome : outcomes) {
        if (outcome.phase == phase) return outcome.from_cache;
    }
    return false;
}

namespace {

// Window padding so edge points keep their neighbouring pixels
constexpr double SAMPLING_WINDOW_PAD_DEG = 0.01;

std::string file_identity(const std::string& path) {
    if (path.empty()) return "none";
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return path + "|missing";
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return path + "|" + std::to_string(size);
    return path + "|" + std::to_string(size) + "|" +
           std::to_string(mtime.time_since_epoch().count());
}

// Content digest for inputs small enough to hash on every run
std::string file_digest(const std::string& path) {
    if (path.empty()) return "none";
    auto digest = sha256_file(path);
    return digest ? *digest : path + "|missing";
}

std::string format_percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

// A tile and the archive it was extracted from
std::string tile_identity(const std::string& path) {
    std::string identity = file_identity(path);
    fs::path archive(path);
    archive += ".gz";
    if (fs::exists(archive)) {
        identity += ";" + file_identity(archive.string());
    }
    return identity;
}

std::string render_tables(const LandCoverTables& tables) {
    std::ostringstream oss;
    oss.precision(17);
    for (const auto& [code, category] : tables.code_to_category) {
        oss << code << ">" << category << ",";
    }
    oss << "|";
    for (const auto& [category, roughness] : tables.category_to_roughness) {
        oss << category << ">" << roughness << ",";
    }
    oss << "|" << tables.default_category << "|" << tables.default_roughness;
    return oss.str();
}

bool phase_enabled(const PipelineSettings& settings, Phase phase) {
    return !settings.run_until.has_value() || phase <= *settings.run_until;
}

} // anonymous namespace

// ============================================================================
// PipelineOrchestrator::Impl - Private implementation
// ============================================================================

class PipelineOrchestrator::Impl {
public:
    Impl(const PipelineConfig& config, std::shared_ptr<LandCoverProvider> provider)
        : config_(config),
          provider_(std::move(provider)),
          logger_("PipelineOrchestrator") {}

    RunResult run() {
        RunResult result;
        RunTracker tracker;
        tracker_ = &tracker;
        enriched_.reset();

        prepare();
        PipelineCache cache(layout_.cache_root);
        cache_ = &cache;

        try {
            cache.acquire_lock();
        } catch (const std::exception& e) {
            throw PipelineError(Phase::SETUP, e.what());
        }

        logger_.info("Starting pipeline for transmitter " + config_.transmitter.id +
                     " (rf-profile-gen " + RFPROF_VERSION_STRING + ")");

        CacheEntry setup = run_setup();

        if (phase_enabled(config_.pipeline, Phase::DATA_PREP)) {
            // DataPrep is network bound and independent of point generation
            auto data_prep = std::async(std::launch::async, [this, &setup] { return run_data_prep(setup); });

            std::optional<CacheEntry> points;
            std::exception_ptr point_error;
            if (phase_enabled(config_.pipeline, Phase::POINT_GENERATION)) {
                try {
                    points = run_point_generation(setup);
                } catch (...) {
                    point_error = std::current_exception();
                }
            }

            CacheEntry prepared = data_prep.get();
            if (point_error) {
                std::rethrow_exception(point_error);
            }

            if (points && phase_enabled(config_.pipeline, Phase::EXTRACTION)) {
                CacheEntry extracted = run_extraction(prepared, *points, result);

                if (phase_enabled(config_.pipeline, Phase::EXPORT)) {
                    run_export(extracted, result);
                }
            }
        }

        result.outcomes = tracker.getOutcomes();
        tracker.printSummary();

        CacheStats stats = cache.get_stats();
        logger_.detailed("Cache: " + std::to_string(stats.hits) + " hits, " +
                         std::to_string(stats.misses) + " misses, " +
                         std::to_string(stats.invalidated) + " invalidated, " +
                         format_percent(stats.hit_rate()) + " hit rate");

        try {
            tracker.exportTrackingData((layout_.cache_root / "last_run.json").string());
        } catch (const std::exception& e) {
            logger_.warning(std::string("Could not write run tracking data: ") + e.what());
        }

        tracker_ = nullptr;
        cache_ = nullptr;
        return result;
    }

    const PipelineConfig& config() const { return config_; }

private:
    struct Layout {
        fs::path project_root;
        fs::path cache_root;
        fs::path output_dir;
        fs::path tile_dir;
        fs::path land_cover_dir;
    };

    PipelineConfig config_;
    std::shared_ptr<LandCoverProvider> provider_;
    Logger logger_;
    Layout layout_;
    PipelineCache* cache_ = nullptr;
    RunTracker* tracker_ = nullptr;

    // Cross-phase data produced in this run; reloaded from artifacts on a cache hit
    std::optional<std::vector<EnrichedPoint>> enriched_;

    fs::path resolve(const std::string& path) const {
        if (path.empty()) return {};
        fs::path p(path);
        if (p.is_absolute()) return p;
        return layout_.project_root / p;
    }

    fs::path artifact(const std::string& name) const {
        return cache_->artifacts_dir() / name;
    }

    /**
     * @brief Validate the configuration and resolve every relative path
     */
    void prepare() {
        try {
            ConfigValidator().validate_or_throw(config_);
        } catch (const ConfigurationError& e) {
            throw PipelineError(Phase::SETUP, e.what());
        }

        layout_.project_root = fs::absolute(config_.pipeline.project_root).lexically_normal();
        layout_.cache_root = resolve(config_.pipeline.cache_dir) / "pipeline";
        layout_.output_dir = resolve(config_.pipeline.output_dir);
        layout_.tile_dir = resolve(config_.elevation.tile_cache_dir);
        layout_.land_cover_dir = resolve(config_.landcover.cache_dir);

        config_.elevation.tile_cache_dir = layout_.tile_dir.string();
        config_.landcover.cache_dir = layout_.land_cover_dir.string();
        config_.landcover.path = resolve(config_.landcover.path).string();
        config_.zones.path = resolve(config_.zones.path).string();

        try {
            fs::create_directories(layout_.cache_root);
        } catch (const fs::filesystem_error& e) {
            throw PipelineError(Phase::SETUP, e.what());
        }
    }

    /**
     * @brief Run one phase through the cache
     *
     * @param is_intact Extra check on a cache hit; false turns the hit into a re-run
     */
    CacheEntry run_phase(Phase phase, const std::string& fingerprint, const fs::path& artifact_path,
                         const std::function<void()>& execute,
                         const std::function<bool(const CacheEntry&)>& is_intact = {}) {
        tracker_->startPhase(phase);
        try {
            bool forced = config_.pipeline.force_refresh.count(phase) > 0;
            if (forced) {
                logger_.info(phase_name(phase) + ": forced refresh");
            } else if (auto entry = cache_->lookup(phase, fingerprint)) {
                if (!is_intact || is_intact(*entry)) {
                    logger_.info(phase_name(phase) + ": reusing cached result");
                    tracker_->completePhase(phase, true, fingerprint, entry->artifact_path);
                    return *entry;
                }
                logger_.warning(phase_name(phase) + ": cached outputs changed, re-running");
            }

            logger_.info(phase_name(phase) + ": executing");
            execute();
            CacheEntry entry = cache_->record(phase, fingerprint, artifact_path);
            tracker_->completePhase(phase, false, fingerprint, entry.artifact_path);
            return entry;
        } catch (const PipelineError& e) {
            tracker_->failPhase(phase, e.what());
            throw;
        } catch (const std::exception& e) {
            tracker_->failPhase(phase, e.what());
            logger_.error(phase_name(phase) + " failed: " + e.what());
            throw PipelineError(phase, e.what());
        }
    }

    // ========================================================================
    // Setup
    // ========================================================================

    CacheEntry run_setup() {
        FingerprintBuilder fp;
        fp.add("version", RFPROF_VERSION_STRING)
          .add("project_root", layout_.project_root.string())
          .add("cache_root", layout_.cache_root.string())
          .add("output_dir", layout_.output_dir.string())
          .add("tile_dir", layout_.tile_dir.string())
          .add("land_cover_dir", layout_.land_cover_dir.string());

        fs::path out = artifact("setup.json");
        auto layout_present = [this](const CacheEntry&) {
            return fs::is_directory(layout_.output_dir) && fs::is_directory(layout_.tile_dir) &&
                   fs::is_directory(layout_.land_cover_dir);
        };

        return run_phase(Phase::SETUP, fp.finish(), out, [&] {
            for (const auto& dir : {layout_.output_dir, layout_.tile_dir, layout_.land_cover_dir,
                                    cache_->artifacts_dir()}) {
                fs::create_directories(dir);
                logger_.detailed("Directory ready: " + dir.string());
            }

            nlohmann::json setup = {
                {"project_root", layout_.project_root.string()},
                {"cache_dir", layout_.cache_root.string()},
                {"output_dir", layout_.output_dir.string()},
                {"tile_cache_dir", layout_.tile_dir.string()},
                {"land_cover_cache_dir", layout_.land_cover_dir.string()}
            };
            write_json_atomic(out, setup);
        }, layout_present);
    }

    // ========================================================================
    // DataPrep
    // ========================================================================

    CacheEntry run_data_prep(const CacheEntry& setup) {
        const auto& tx = config_.transmitter;
        const auto& elevation = config_.elevation;
        const auto& landcover = config_.landcover;

        FingerprintBuilder fp;
        fp.add("setup.fingerprint", setup.fingerprint)
          .add("setup.digest", setup.artifact_digest)
          .add("tx.longitude", tx.longitude)
          .add("tx.latitude", tx.latitude)
          .add("generation.max_distance_km", config_.generation.max_distance_km)
          .add("elevation.margin_km", elevation.margin_km)
          .add("elevation.tile_cache_dir", elevation.tile_cache_dir)
          .add("elevation.download", elevation.download_missing)
          .add("elevation.base_url", elevation.base_url)
          .add("landcover.provider", landcover.provider)
          .add("landcover.file", file_digest(landcover.path))
          .add("landcover.cache_dir", landcover.cache_dir)
          .add("landcover.year", landcover.year)
          .add("landcover.buffer_m", landcover.buffer_m)
          .add("landcover.chip_px", landcover.chip_px)
          .add("landcover.required", landcover.required)
          .add("landcover.collection_id", landcover.collection_id)
          .add("landcover.process_url", landcover.process_url);

        fs::path out = artifact("dataprep.json");

        // Forcing DataPrep also bypasses the tile and land-cover download caches
        bool refetch = config_.pipeline.force_refresh.count(Phase::DATA_PREP) > 0;

        TerrainTileCache::Config tile_config;
        tile_config.cache_directory = elevation.tile_cache_dir;
        tile_config.base_url = elevation.base_url;
        tile_config.download_missing = elevation.download_missing;
        tile_config.force_download = refetch;
        tile_config.timeout_seconds = elevation.timeout_seconds;
        tile_config.max_retries = config_.pipeline.max_retries;

        auto sources_unchanged = [this, &tile_config](const CacheEntry& entry) {
            try {
                auto prepared = read_json(entry.artifact_path);
                if (!fs::exists(prepared.at("elevation_mosaic").get<std::string>())) return false;

                for (const auto& [path, identity] : prepared.at("tile_identities").items()) {
                    if (tile_identity(path) != identity.get<std::string>()) {
                        logger_.info("Elevation tile changed: " + path);
                        return false;
                    }
                }
                TerrainTileCache tiles(tile_config);
                for (const auto& name : prepared.at("missing_tiles")) {
                    if (tiles.has_local(name.get<std::string>())) {
                        logger_.info("Elevation tile now available: " + name.get<std::string>());
                        return false;
                    }
                }

                const auto& lc = prepared.at("land_cover");
                if (!lc.is_null() && file_digest(lc.at("path").get<std::string>()) != lc.at("digest").get<std::string>()) {
                    logger_.info("Land-cover raster changed: " + lc.at("path").get<std::string>());
                    return false;
                }
                return true;
            } catch (const std::exception&) {
                return false;
            }
        };

        return run_phase(Phase::DATA_PREP, fp.finish(), out, [&] {
            double radius_m = (config_.generation.max_distance_km + elevation.margin_km) * 1000.0;
            BoundingBox bounds = BoundingBox::around(tx.position(), radius_m);

            TerrainTileCache tiles(tile_config);

            auto coverage = tiles.collect_tiles(bounds);
            if (coverage.tile_paths.empty()) {
                throw DataUnavailableError("no elevation tiles available in " + elevation.tile_cache_dir);
            }
            if (!coverage.complete()) {
                logger_.warning(std::to_string(coverage.missing_tiles.size()) +
                                " elevation tiles missing; affected points use the fallback elevation");
            }

            fs::path mosaic = artifact("elevation_mosaic.vrt");
            TerrainTileCache::build_mosaic(coverage.tile_paths, mosaic.string());

            nlohmann::json land_cover = nullptr;
            LandCoverRequest request;
            request.lat = tx.latitude;
            request.lon = tx.longitude;
            request.year = landcover.year;
            request.buffer_m = landcover.buffer_m;
            request.chip_px = landcover.chip_px;
            request.force_download = refetch;

            try {
                auto provider = provider_ ? provider_
                                          : make_land_cover_provider(landcover, config_.pipeline.max_retries);
                std::string path = fs::absolute(provider->fetch_or_cache(request)).string();
                auto digest = sha256_file(path);
                if (!digest) {
                    throw DataUnavailableError("cannot read land-cover raster " + path);
                }
                land_cover = {
                    {"path", path},
                    {"digest", *digest},
                    {"provider", provider->name()},
                    {"bounds", land_cover_bounds(request)}
                };
            } catch (const ConfigurationError&) {
                throw;
            } catch (const std::exception& e) {
                if (landcover.required) {
                    throw DataUnavailableError(std::string("land cover: ") + e.what());
                }
                logger_.warning(std::string("Land cover unavailable, using nodata code: ") + e.what());
            }

            // Identities make the artifact, and so every downstream fingerprint, follow source changes
            nlohmann::json tile_identities = nlohmann::json::object();
            for (const auto& path : coverage.tile_paths) {
                tile_identities[path] = tile_identity(path);
            }

            nlohmann::json prepared = {
                {"elevation_mosaic", mosaic.string()},
                {"tiles", coverage.tile_paths},
                {"tile_identities", tile_identities},
                {"missing_tiles", coverage.missing_tiles},
                {"elevation_bounds", bounds},
                {"land_cover", land_cover}
            };
            write_json_atomic(out, prepared);
            tracker_->addPhaseData(Phase::DATA_PREP, "tiles", std::to_string(coverage.tile_paths.size()));
        }, sources_unchanged);
    }

    // ========================================================================
    // PointGeneration
    // ========================================================================

    CacheEntry run_point_generation(const CacheEntry& setup) {
        auto params = PointGenerator::Parameters::from_config(config_.generation);

        FingerprintBuilder fp;
        fp.add("setup.fingerprint", setup.fingerprint)
          .add("setup.digest", setup.artifact_digest)
          .add("tx.longitude", config_.transmitter.longitude)
          .add("tx.latitude", config_.transmitter.latitude)
          .add("max_distance_km", params.max_distance_km)
          .add("distance_step_km", params.distance_step_km)
          .add("azimuths_deg", params.azimuths_deg);

        fs::path out = artifact("points.json");
        return run_phase(Phase::POINT_GENERATION, fp.finish(), out, [&] {
            auto points = PointGenerator(config_.transmitter).generate(params);
            nlohmann::json generated = {
                {"origin", config_.transmitter.position()},
                {"points", points}
            };
            write_json_atomic(out, generated);
            tracker_->addPhaseData(Phase::POINT_GENERATION, "points", std::to_string(points.size()));
        });
    }

    // ========================================================================
    // Extraction
    // ========================================================================

    CacheEntry run_extraction(const CacheEntry& prepared, const CacheEntry& generated, RunResult& result) {
        const auto& zones = config_.zones;
        ElevationPolicy policy = ElevationPolicy::from_config(config_.elevation);

        FingerprintBuilder fp;
        fp.add("dataprep.fingerprint", prepared.fingerprint)
          .add("dataprep.digest", prepared.artifact_digest)
          .add("points.fingerprint", generated.fingerprint)
          .add("points.digest", generated.artifact_digest)
          .add("elevation.min_m", policy.min_m)
          .add("elevation.max_m", policy.max_m)
          .add("elevation.fallback_m", policy.fallback_m)
          .add("landcover.nodata_code", config_.landcover.nodata_code)
          .add("tables", render_tables(config_.tables))
          .add("zones.file", file_identity(zones.path))
          .add("zones.id_field", zones.id_field)
          .add("zones.default_zone", zones.default_zone);

        fs::path out = artifact("enriched.json");
        CacheEntry entry = run_phase(Phase::EXTRACTION, fp.finish(), out, [&] {
            auto data = read_json(prepared.artifact_path);
            auto points = read_json(generated.artifact_path).at("points").get<std::vector<ReceiverPoint>>();

            std::vector<GeoPoint> positions;
            positions.reserve(points.size());
            for (const auto& p : points) positions.push_back(p.position);
            BoundingBox window = BoundingBox::covering(positions);
            window.min_x -= SAMPLING_WINDOW_PAD_DEG;
            window.min_y -= SAMPLING_WINDOW_PAD_DEG;
            window.max_x += SAMPLING_WINDOW_PAD_DEG;
            window.max_y += SAMPLING_WINDOW_PAD_DEG;

            RasterSource elevation = RasterSource::open(data.at("elevation_mosaic").get<std::string>(), window);

            std::optional<RasterSource> land_cover;
            if (!data.at("land_cover").is_null()) {
                land_cover = RasterSource::open(data["land_cover"].at("path").get<std::string>(), window);
            }

            ZoneResolver resolver = zones.path.empty()
                ? ZoneResolver({}, zones.default_zone)
                : ZoneResolver::from_file(zones.path, zones.id_field, zones.default_zone);

            Extractor extractor(policy, config_.tables, config_.landcover.nodata_code);
            const RasterSource* lc = land_cover ? &*land_cover : nullptr;
            Extractor::Result extracted = config_.pipeline.num_threads > 1
                ? extractor.extract(ParallelPolicy{static_cast<unsigned>(config_.pipeline.num_threads)},
                                    points, &elevation, lc, resolver)
                : extractor.extract(SequentialPolicy{}, points, &elevation, lc, resolver);

            if (extracted.report.has_anomalies()) {
                logger_.warning("Extraction anomalies:\n" + extracted.report.summary());
            }

            nlohmann::json enriched = {
                {"report", extracted.report},
                {"points", extracted.points}
            };
            write_json_atomic(out, enriched);
            tracker_->addPhaseData(Phase::EXTRACTION, "points", std::to_string(extracted.points.size()));
            enriched_ = std::move(extracted.points);
        });

        try {
            auto enriched = read_json(entry.artifact_path);
            result.report = enriched.at("report").get<ExtractionReport>();
            if (!enriched_) {
                enriched_ = enriched.at("points").get<std::vector<EnrichedPoint>>();
            }
        } catch (const std::exception& e) {
            throw PipelineError(Phase::EXTRACTION, std::string("unreadable extraction artifact: ") + e.what());
        }
        return entry;
    }

    // ========================================================================
    // Export
    // ========================================================================

    CacheEntry run_export(const CacheEntry& extracted, RunResult& result) {
        const auto& tx = config_.transmitter;
        fs::path csv_path = layout_.output_dir / (config_.pipeline.base_name + ".csv");
        fs::path geojson_path = layout_.output_dir / (config_.pipeline.base_name + "_points.geojson");

        FingerprintBuilder fp;
        fp.add("extraction.fingerprint", extracted.fingerprint)
          .add("extraction.digest", extracted.artifact_digest)
          .add("tx.id", tx.id)
          .add("tx.frequency_ghz", tx.frequency_ghz)
          .add("tx.time_percentage", tx.time_percentage)
          .add("tx.antenna_height_m", tx.antenna_height_m)
          .add("tx.receiver_height_m", tx.receiver_height_m)
          .add("tx.polarization", tx.polarization)
          .add("include_transmitter", config_.pipeline.include_transmitter_in_profiles)
          .add("profiles_csv", csv_path.string())
          .add("points_geojson", geojson_path.string());

        fs::path out = artifact("export.json");

        auto outputs_intact = [](const CacheEntry& entry) {
            try {
                auto exported = read_json(entry.artifact_path);
                for (const char* key : {"profiles_csv", "points_geojson"}) {
                    const auto& output = exported.at(key);
                    auto digest = sha256_file(output.at("path").get<std::string>());
                    if (!digest || *digest != output.at("digest").get<std::string>()) return false;
                }
                return true;
            } catch (const std::exception&) {
                return false;
            }
        };

        CacheEntry entry = run_phase(Phase::EXPORT, fp.finish(), out, [&] {
            ProfileBuilder::Options options;
            options.include_transmitter = config_.pipeline.include_transmitter_in_profiles;
            auto profiles = ProfileBuilder(tx, options).build(*enriched_);

            ProfileCsvExporter().export_csv(profiles, csv_path.string());
            if (!GeoJSONExporter().export_geojson(*enriched_, geojson_path.string())) {
                throw std::runtime_error("could not write " + geojson_path.string());
            }

            auto csv_digest = sha256_file(csv_path);
            auto geojson_digest = sha256_file(geojson_path);
            if (!csv_digest || !geojson_digest) {
                throw std::runtime_error("exported files disappeared before they could be digested");
            }

            nlohmann::json exported = {
                {"profile_count", profiles.size()},
                {"profiles_csv", {{"path", csv_path.string()}, {"digest", *csv_digest}}},
                {"points_geojson", {{"path", geojson_path.string()}, {"digest", *geojson_digest}}}
            };
            write_json_atomic(out, exported);
        }, outputs_intact);

        try {
            auto exported = read_json(entry.artifact_path);
            result.profile_count = exported.at("profile_count").get<size_t>();
            result.profiles_csv = exported.at("profiles_csv").at("path").get<std::string>();
            result.points_geojson = exported.at("points_geojson").at("path").get<std::string>();
        } catch (const std::exception& e) {
            throw PipelineError(Phase::EXPORT, std::string("unreadable export artifact: ") + e.what());
        }

        tracker_->trackOutputFile(result.profiles_csv, "CSV");
        tracker_->trackOutputFile(result.points_geojson, "GeoJSON");
        return entry;
    }
};

// ============================================================================
// PipelineOrchestrator public interface
// ============================================================================

PipelineOrchestrator::PipelineOrchestrator(const PipelineConfig& config)
    : impl_(std::make_unique<Impl>(config, nullptr)) {}

PipelineOrchestrator::PipelineOrchestrator(const PipelineConfig& config,
                                           std::shared_ptr<LandCoverProvider> provider)
    : impl_(std::make_unique<Impl>(config, std::move(provider))) {}

PipelineOrchestrator::~PipelineOrchestrator() = default;

RunResult PipelineOrchestrator::run() {
    return impl_->run();
}

const PipelineConfig& PipelineOrchestrator::get_config() const {
    return impl_->config();
}

} // namespace rfprof
