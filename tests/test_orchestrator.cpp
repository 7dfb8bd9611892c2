/**
 * @file test_orchestrator.cpp
 * @brief End-to-end phase runs against local fixtures: caching, invalidation and failures
 */

#include "TestSupport.hpp"
#include "core/LandCoverProvider.hpp"
#include "core/PipelineCache.hpp"
#include <nlohmann/json.hpp>

using namespace rfprof;

namespace {

/**
 * @brief Serves a fixed raster and counts how often it was asked
 */
class CountingProvider : public LandCoverProvider {
public:
    explicit CountingProvider(std::string path, bool fail = false) : path_(std::move(path)), fail_(fail) {}

    std::string fetch_or_cache(const LandCoverRequest& request) override {
        ++calls;
        last_forced = request.force_download;
        if (fail_) {
            throw DataUnavailableError("land-cover service unreachable");
        }
        if (request.force_download && on_refetch) {
            on_refetch(path_);
        }
        return path_;
    }

    std::string name() const override { return "counting"; }

    std::atomic<int> calls{0};
    std::atomic<bool> last_forced{false};

    /// Stands in for a service whose imagery changed since the chip was cached
    std::function<void(const std::string&)> on_refetch;

private:
    std::string path_;
    bool fail_;
};

/**
 * @brief Project tree with one DEM tile, a land-cover raster and a zone file
 *
 * Transmitter at the centre of tile N09W014, four rays of 2 km at 0.5 km steps.
 */
struct Project {
    test::TempDir dir{"rfprof_pipeline"};
    std::shared_ptr<CountingProvider> provider;

    Project() {
        std::filesystem::create_directories(dir.path() / "tiles");
        test::write_constant_geotiff(dir.file("tiles/N09W014.tif"), -14.0, 10.0, 1.0, 20, 120.0,
                                     -32768.0, GDT_Int16);
        test::write_constant_geotiff(dir.file("lc.tif"), -13.6, 9.6, 0.2, 40, 50.0, 0.0, GDT_Byte);
        test::write_text(dir.file("zones.geojson"), test::feature_collection({
            test::zone_feature(3, {{-13.6, 9.4}, {-13.52, 9.4}, {-13.52, 9.6}, {-13.6, 9.6}}),
            test::zone_feature(1, {{-13.48, 9.4}, {-13.4, 9.4}, {-13.4, 9.6}, {-13.48, 9.6}})
        }));
        provider = std::make_shared<CountingProvider>(dir.file("lc.tif"));
    }

    PipelineConfig config() const {
        PipelineConfig config;
        config.transmitter.longitude = -13.5;
        config.transmitter.latitude = 9.5;
        config.generation.max_distance_km = 2.0;
        config.generation.distance_step_km = 0.5;
        config.generation.azimuths_deg = {0.0, 90.0, 180.0, 270.0};
        config.elevation.tile_cache_dir = "tiles";
        config.landcover.path = "lc.tif";
        config.landcover.cache_dir = "landcover";
        config.landcover.buffer_m = 3000.0;
        config.zones.path = "zones.geojson";
        config.pipeline.project_root = dir.path().string();
        config.pipeline.cache_dir = "cache";
        config.pipeline.output_dir = "out";
        config.pipeline.base_name = "profiles";
        return config;
    }

    RunResult run(const PipelineConfig& config) const {
        return PipelineOrchestrator(config, provider).run();
    }

    std::string csv() const { return test::read_text(dir.file("out/profiles.csv")); }
};

std::optional<Phase> failed_phase(const std::function<void()>& action) {
    try {
        action();
    } catch (const PipelineError& e) {
        return e.phase();
    }
    return std::nullopt;
}

bool first_run_executes_every_phase() {
    Project project;
    RunResult result = project.run(project.config());

    RFPROF_CHECK(result.outcomes.size() == 5);
    for (Phase phase : ALL_PHASES) {
        RFPROF_CHECK(result.executed(phase));
    }
    RFPROF_CHECK(project.provider->calls == 1);

    RFPROF_CHECK(result.profile_count == 4);
    RFPROF_CHECK(result.report.total_points == 17);
    RFPROF_CHECK(result.report.elevation_fallbacks() == 0);
    RFPROF_CHECK(result.report.land_cover_missing == 0);
    RFPROF_CHECK(result.report.zone_defaults == 0);

    RFPROF_CHECK(std::filesystem::exists(result.profiles_csv));
    RFPROF_CHECK(std::filesystem::exists(result.points_geojson));

    std::string csv = project.csv();
    RFPROF_CHECK(csv.rfind("f;p;d;h;R;Ct;zone;", 0) == 0);
    RFPROF_CHECK(csv.find("[0, 0.5, 1, 1.5, 2]") != std::string::npos);
    RFPROF_CHECK(csv.find("[120, 120, 120, 120, 120]") != std::string::npos);
    RFPROF_CHECK(csv.find("[3, 3, 3, 3, 3]") != std::string::npos);

    auto points = nlohmann::json::parse(test::read_text(result.points_geojson));
    RFPROF_CHECK(points["features"].size() == 17);

    auto run_record = nlohmann::json::parse(test::read_text(project.dir.file("cache/pipeline/last_run.json")));
    RFPROF_CHECK(!run_record.empty());
    return true;
}

bool second_run_is_fully_cached() {
    Project project;
    PipelineConfig config = project.config();
    project.run(config);
    std::string first_csv = project.csv();

    RunResult second = project.run(config);
    for (Phase phase : ALL_PHASES) {
        RFPROF_CHECK(second.from_cache(phase));
    }
    RFPROF_CHECK(project.provider->calls == 1);
    RFPROF_CHECK(second.profile_count == 4);
    RFPROF_CHECK(second.report.total_points == 17);
    RFPROF_CHECK(project.csv() == first_csv);

    // Thread count does not change results, so it does not invalidate them
    config.pipeline.num_threads = 4;
    RunResult threaded = project.run(config);
    RFPROF_CHECK(threaded.from_cache(Phase::EXTRACTION));
    return true;
}

bool step_change_reuses_data_prep() {
    Project project;
    PipelineConfig config = project.config();
    project.run(config);

    config.generation.distance_step_km = 0.25;
    RunResult result = project.run(config);
    RFPROF_CHECK(result.from_cache(Phase::SETUP));
    RFPROF_CHECK(result.from_cache(Phase::DATA_PREP));
    RFPROF_CHECK(result.executed(Phase::POINT_GENERATION));
    RFPROF_CHECK(result.executed(Phase::EXTRACTION));
    RFPROF_CHECK(result.executed(Phase::EXPORT));
    RFPROF_CHECK(project.provider->calls == 1);
    RFPROF_CHECK(result.report.total_points == 33);
    return true;
}

bool radio_parameters_only_rerun_export() {
    Project project;
    PipelineConfig config = project.config();
    project.run(config);

    config.transmitter.frequency_ghz = 2.1;
    RunResult result = project.run(config);
    RFPROF_CHECK(result.from_cache(Phase::EXTRACTION));
    RFPROF_CHECK(result.executed(Phase::EXPORT));
    RFPROF_CHECK(project.csv().find("\n2.1;") != std::string::npos);
    return true;
}

bool forced_refresh_reruns_named_phase() {
    Project project;
    PipelineConfig config = project.config();
    project.run(config);

    config.pipeline.force_refresh = {Phase::EXTRACTION};
    RunResult result = project.run(config);
    RFPROF_CHECK(result.from_cache(Phase::DATA_PREP));
    RFPROF_CHECK(result.executed(Phase::EXTRACTION));

    // Identical extraction output leaves the export fingerprint unchanged
    RFPROF_CHECK(result.from_cache(Phase::EXPORT));

    config.pipeline.force_refresh = {Phase::DATA_PREP};
    result = project.run(config);
    RFPROF_CHECK(result.executed(Phase::DATA_PREP));
    RFPROF_CHECK(project.provider->calls == 2);
    return true;
}

bool altered_output_reruns_export() {
    Project project;
    PipelineConfig config = project.config();
    RunResult first = project.run(config);

    test::write_text(first.profiles_csv, "edited by hand\n");
    RunResult second = project.run(config);
    RFPROF_CHECK(second.from_cache(Phase::EXTRACTION));
    RFPROF_CHECK(second.executed(Phase::EXPORT));
    RFPROF_CHECK(project.csv().rfind("f;p;d;", 0) == 0);

    std::filesystem::remove(first.points_geojson);
    RunResult third = project.run(config);
    RFPROF_CHECK(third.executed(Phase::EXPORT));
    RFPROF_CHECK(std::filesystem::exists(first.points_geojson));
    return true;
}

bool changed_land_cover_reruns_extraction() {
    Project project;
    PipelineConfig config = project.config();
    project.run(config);
    RFPROF_CHECK(project.csv().find("[10, 10, 10, 10, 10]") != std::string::npos);

    // Same path, same size, new codes: 10 is tree cover, roughness 15
    test::write_constant_geotiff(project.dir.file("lc.tif"), -13.6, 9.6, 0.2, 40, 10.0, 0.0, GDT_Byte);
    RunResult result = project.run(config);
    RFPROF_CHECK(result.executed(Phase::DATA_PREP));
    RFPROF_CHECK(result.executed(Phase::EXTRACTION));
    RFPROF_CHECK(result.executed(Phase::EXPORT));
    RFPROF_CHECK(project.csv().find("[15, 15, 15, 15, 15]") != std::string::npos);
    RFPROF_CHECK(project.csv().find("[10, 10, 10, 10, 10]") == std::string::npos);
    return true;
}

bool replaced_provider_raster_is_detected() {
    // The provider serves its own cached chip, so the configuration does not change
    Project project;
    test::write_constant_geotiff(project.dir.file("chip.tif"), -13.6, 9.6, 0.2, 40, 50.0, 0.0, GDT_Byte);
    auto provider = std::make_shared<CountingProvider>(project.dir.file("chip.tif"));
    PipelineConfig config = project.config();
    PipelineOrchestrator(config, provider).run();

    test::write_constant_geotiff(project.dir.file("chip.tif"), -13.6, 9.6, 0.2, 40, 10.0, 0.0, GDT_Byte);
    RunResult result = PipelineOrchestrator(config, provider).run();
    RFPROF_CHECK(result.executed(Phase::DATA_PREP));
    RFPROF_CHECK(result.executed(Phase::EXTRACTION));
    RFPROF_CHECK(provider->calls == 2);
    RFPROF_CHECK(project.csv().find("[15, 15, 15, 15, 15]") != std::string::npos);
    return true;
}

bool replaced_elevation_tile_reruns_extraction() {
    Project project;
    PipelineConfig config = project.config();
    project.run(config);

    std::string tile = project.dir.file("tiles/N09W014.tif");
    auto written_at = std::filesystem::last_write_time(tile);
    test::write_constant_geotiff(tile, -14.0, 10.0, 1.0, 20, 300.0, -32768.0, GDT_Int16);
    std::filesystem::last_write_time(tile, written_at + std::chrono::hours(1));

    RunResult result = project.run(config);
    RFPROF_CHECK(result.executed(Phase::DATA_PREP));
    RFPROF_CHECK(result.executed(Phase::EXTRACTION));
    RFPROF_CHECK(project.provider->calls == 2);
    RFPROF_CHECK(project.csv().find("[300, 300, 300, 300, 300]") != std::string::npos);
    return true;
}

bool forced_data_prep_refetches_sources() {
    Project project;
    PipelineConfig config = project.config();
    project.run(config);
    RFPROF_CHECK(!project.provider->last_forced);

    project.provider->on_refetch = [](const std::string& path) {
        test::write_constant_geotiff(path, -13.6, 9.6, 0.2, 40, 10.0, 0.0, GDT_Byte);
    };
    config.pipeline.force_refresh = {Phase::DATA_PREP};
    RunResult result = project.run(config);
    RFPROF_CHECK(project.provider->last_forced);
    RFPROF_CHECK(result.executed(Phase::DATA_PREP));
    RFPROF_CHECK(result.executed(Phase::EXTRACTION));
    RFPROF_CHECK(result.executed(Phase::EXPORT));
    RFPROF_CHECK(project.csv().find("[15, 15, 15, 15, 15]") != std::string::npos);

    // Without the force the next run is served from the cache again
    config.pipeline.force_refresh.clear();
    result = project.run(config);
    RFPROF_CHECK(!project.provider->last_forced);
    RFPROF_CHECK(result.from_cache(Phase::EXTRACTION));
    return true;
}

bool run_until_stops_early() {
    Project project;
    PipelineConfig config = project.config();
    config.pipeline.run_until = Phase::POINT_GENERATION;

    RunResult result = project.run(config);
    RFPROF_CHECK(result.outcomes.size() == 3);
    RFPROF_CHECK(result.executed(Phase::POINT_GENERATION));
    RFPROF_CHECK(!result.executed(Phase::EXTRACTION) && !result.from_cache(Phase::EXTRACTION));
    RFPROF_CHECK(result.profile_count == 0);
    RFPROF_CHECK(!std::filesystem::exists(project.dir.file("out/profiles.csv")));

    // Resuming picks up the finished phases
    config.pipeline.run_until.reset();
    result = project.run(config);
    RFPROF_CHECK(result.from_cache(Phase::POINT_GENERATION));
    RFPROF_CHECK(result.executed(Phase::EXPORT));
    return true;
}

bool concurrent_run_is_rejected() {
    Project project;
    PipelineConfig config = project.config();

    PipelineCache holder(project.dir.path() / "cache" / "pipeline");
    holder.acquire_lock();
    RFPROF_CHECK(failed_phase([&] { project.run(config); }) == Phase::SETUP);
    RFPROF_CHECK(project.provider->calls == 0);

    holder.release_lock();
    RFPROF_CHECK(!failed_phase([&] { project.run(config); }).has_value());
    return true;
}

bool invalid_configuration_fails_setup() {
    Project project;
    PipelineConfig config = project.config();
    config.generation.distance_step_km = -1.0;
    RFPROF_CHECK(failed_phase([&] { project.run(config); }) == Phase::SETUP);
    RFPROF_CHECK(!std::filesystem::exists(project.dir.file("out")));
    return true;
}

bool missing_elevation_fails_data_prep() {
    Project project;
    PipelineConfig config = project.config();
    std::filesystem::remove(project.dir.file("tiles/N09W014.tif"));
    RFPROF_CHECK(failed_phase([&] { project.run(config); }) == Phase::DATA_PREP);
    return true;
}

bool land_cover_failure_respects_required_flag() {
    Project project;
    PipelineConfig config = project.config();
    auto broken = std::make_shared<CountingProvider>("", true);

    RFPROF_CHECK(failed_phase([&] { PipelineOrchestrator(config, broken).run(); }) == Phase::DATA_PREP);

    config.landcover.required = false;
    RunResult result = PipelineOrchestrator(config, broken).run();
    RFPROF_CHECK(result.executed(Phase::EXPORT));
    RFPROF_CHECK(result.report.land_cover_missing == 17);
    RFPROF_CHECK(project.csv().find("[2, 2, 2, 2, 2]") != std::string::npos);
    return true;
}

} // anonymous namespace

int main() {
    test::TestRunner runner;
    runner.run("first_run_executes_every_phase", first_run_executes_every_phase);
    runner.run("second_run_is_fully_cached", second_run_is_fully_cached);
    runner.run("step_change_reuses_data_prep", step_change_reuses_data_prep);
    runner.run("radio_parameters_only_rerun_export", radio_parameters_only_rerun_export);
    runner.run("forced_refresh_reruns_named_phase", forced_refresh_reruns_named_phase);
    runner.run("altered_output_reruns_export", altered_output_reruns_export);
    runner.run("changed_land_cover_reruns_extraction", changed_land_cover_reruns_extraction);
    runner.run("replaced_provider_raster_is_detected", replaced_provider_raster_is_detected);
    runner.run("replaced_elevation_tile_reruns_extraction", replaced_elevation_tile_reruns_extraction);
    runner.run("forced_data_prep_refetches_sources", forced_data_prep_refetches_sources);
    runner.run("run_until_stops_early", run_until_stops_early);
    runner.run("concurrent_run_is_rejected", concurrent_run_is_rejected);
    runner.run("invalid_configuration_fails_setup", invalid_configuration_fails_setup);
    runner.run("missing_elevation_fails_data_prep", missing_elevation_fails_data_prep);
    runner.run("land_cover_failure_respects_required_flag", land_cover_failure_respects_required_flag);
    return runner.result();
}
