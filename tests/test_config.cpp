/**
 * @file test_config.cpp
 * @brief Configuration file loading, validation and command line precedence
 */

#include "TestSupport.hpp"
#include "core/ConfigValidator.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include <iterator>

using namespace rfprof;
using json = nlohmann::json;

namespace {

PipelineConfig valid_config() {
    PipelineConfig config;
    config.landcover.path = "data/input/landcover/lcm10.tif";
    return config;
}

bool has_conflict_mentioning(const ValidationResult& result, const std::string& text) {
    for (const auto& conflict : result.conflicts) {
        for (const auto& param : conflict.involved_params) {
            if (param.find(text) != std::string::npos) return true;
        }
    }
    return false;
}

// argv adapter; the strings outlive the parse call
class Argv {
public:
    explicit Argv(std::vector<std::string> args) : storage_(std::move(args)) {
        storage_.insert(storage_.begin(), "rf-profile-gen");
        for (auto& arg : storage_) pointers_.push_back(arg.data());
        pointers_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

bool sections_override_defaults() {
    json document = {
        {"transmitter", {{"id", "TX_0042"}, {"latitude", 8.5}, {"longitude", -12.0}, {"antenna_height_tx", 30.0}}},
        {"propagation", {{"frequency_ghz", 2.4}, {"polarization", "vertical"}, {"time_percentage", 10.0}}},
        {"receiver_generation", {{"max_distance_km", 5.0}, {"distance_step_km", 0.1}, {"azimuths_deg", {0.0, 45.0}}}},
        {"elevation", {{"download", true}, {"fallback_m", 3.0}}},
        {"landcover", {{"path", "lc.tif"}, {"required", false}}},
        {"land_cover_tables", {{"code_to_category", {{"10", 5}, {"80", 1}}}, {"default_category", 3}}},
        {"zones", {{"path", "zones.geojson"}, {"default_zone", 2}}},
        {"pipeline", {{"num_threads", 4}, {"force_refresh", {"Extraction", "export"}}, {"run_until", "Extraction"}}}
    };

    ConfigurationManager manager;
    manager.load_from_json(document);
    const PipelineConfig& config = manager.get_config();

    RFPROF_CHECK(config.transmitter.id == "TX_0042");
    RFPROF_CHECK(config.transmitter.latitude == 8.5);
    RFPROF_CHECK(config.transmitter.antenna_height_m == 30.0);
    RFPROF_CHECK(config.transmitter.receiver_height_m == 10.0);
    RFPROF_CHECK(config.transmitter.polarization == 2);
    RFPROF_CHECK(config.transmitter.frequency_ghz == 2.4);
    RFPROF_CHECK((config.generation.azimuths_deg == std::vector<double>{0.0, 45.0}));
    RFPROF_CHECK(config.generation.num_azimuths == 36);
    RFPROF_CHECK(config.elevation.download_missing);
    RFPROF_CHECK(!config.landcover.required);
    RFPROF_CHECK(config.tables.code_to_category.size() == 2);
    RFPROF_CHECK(config.tables.category_for(10) == 5);
    RFPROF_CHECK(config.tables.category_for(50) == 3);
    RFPROF_CHECK(config.zones.default_zone == 2);
    RFPROF_CHECK(config.pipeline.num_threads == 4);
    RFPROF_CHECK((config.pipeline.force_refresh == std::set<Phase>{Phase::EXTRACTION, Phase::EXPORT}));
    RFPROF_CHECK(config.pipeline.run_until == Phase::EXTRACTION);
    return true;
}

bool malformed_documents_are_configuration_errors() {
    ConfigurationManager manager;
    RFPROF_CHECK_THROWS(manager.load_from_json(json::array()), ConfigurationError);
    RFPROF_CHECK_THROWS(manager.load_from_json({{"transmitter", 5}}), ConfigurationError);
    RFPROF_CHECK_THROWS(manager.load_from_json({{"transmitter", {{"latitude", "north"}}}}), ConfigurationError);
    RFPROF_CHECK_THROWS(manager.load_from_json({{"propagation", {{"polarization", "circular"}}}}), ConfigurationError);
    RFPROF_CHECK_THROWS(manager.load_from_json({{"pipeline", {{"run_until", "Render"}}}}), ConfigurationError);
    RFPROF_CHECK_THROWS(manager.load_from_json({{"land_cover_tables", {{"code_to_category", {{"ten", 4}}}}}}),
                        ConfigurationError);
    RFPROF_CHECK_THROWS(manager.load_from_file("/nonexistent/run.json"), ConfigurationError);

    test::TempDir dir("rfprof_config");
    std::string path = dir.file("broken.json");
    test::write_text(path, "{ \"transmitter\": ");
    RFPROF_CHECK_THROWS(manager.load_from_file(path), ConfigurationError);
    return true;
}

bool saved_file_reloads_identically() {
    test::TempDir dir("rfprof_config");
    std::string path = dir.file("run.json");

    ConfigurationManager original;
    PipelineConfig config = valid_config();
    config.transmitter.id = "TX_0007";
    config.generation.azimuths_deg = {10.0, 190.0};
    config.pipeline.run_until = Phase::POINT_GENERATION;
    config.pipeline.force_refresh = {Phase::DATA_PREP};
    original.set_config(config);
    RFPROF_CHECK(original.save_to_file(path));

    ConfigurationManager reloaded;
    reloaded.load_from_file(path);
    RFPROF_CHECK(reloaded.to_json() == original.to_json());
    RFPROF_CHECK(reloaded.get_config().config_file == path);
    return true;
}

bool default_document_lists_every_section() {
    json document = ConfigurationManager::default_document();
    for (const char* section : {"transmitter", "propagation", "receiver_generation", "elevation",
                                "landcover", "land_cover_tables", "zones", "pipeline"}) {
        RFPROF_CHECK(document.contains(section));
    }
    RFPROF_CHECK(document["receiver_generation"]["distance_step_km"] == 0.03);
    RFPROF_CHECK(document["land_cover_tables"]["code_to_category"]["50"] == 3);
    return true;
}

bool validator_accepts_reference_run() {
    ValidationResult result = ConfigValidator().validate(valid_config());
    RFPROF_CHECK(result.is_valid);
    RFPROF_CHECK(result.format_error_message().empty());
    return true;
}

bool validator_collects_every_conflict() {
    PipelineConfig config = valid_config();
    config.transmitter.latitude = 91.0;
    config.transmitter.frequency_ghz = 40.0;
    config.transmitter.polarization = 3;
    config.generation.distance_step_km = 0.0;
    config.generation.azimuths_deg = {0.0, 360.0};
    config.pipeline.num_threads = 0;

    ValidationResult result = ConfigValidator().validate(config);
    RFPROF_CHECK(result.has_errors());
    RFPROF_CHECK(result.conflicts.size() == 6);
    RFPROF_CHECK(has_conflict_mentioning(result, "transmitter.latitude"));
    RFPROF_CHECK(has_conflict_mentioning(result, "propagation.frequency_ghz"));
    RFPROF_CHECK(has_conflict_mentioning(result, "propagation.polarization"));
    RFPROF_CHECK(has_conflict_mentioning(result, "distance_step_km"));
    RFPROF_CHECK(has_conflict_mentioning(result, "360"));
    RFPROF_CHECK(has_conflict_mentioning(result, "num_threads"));

    std::string message = result.format_error_message();
    RFPROF_CHECK(message.find("Conflict 6") != std::string::npos);
    RFPROF_CHECK_THROWS(ConfigValidator().validate_or_throw(config), ConfigurationError);
    return true;
}

bool validator_checks_land_cover_source() {
    PipelineConfig config = valid_config();
    config.landcover.path.clear();
    RFPROF_CHECK(ConfigValidator().validate(config).has_errors());

    config.landcover.required = false;
    RFPROF_CHECK(ConfigValidator().validate(config).is_valid);

    config.landcover.provider = "sentinel-hub";
    RFPROF_CHECK(ConfigValidator().validate(config).has_errors());
    config.landcover.collection_id = "0b9a3c1e";
    RFPROF_CHECK(ConfigValidator().validate(config).is_valid);

    config.landcover.provider = "wms";
    RFPROF_CHECK(ConfigValidator().validate(config).has_errors());

    // Legal but suspicious
    config = valid_config();
    config.landcover.buffer_m = 500.0;
    ValidationResult result = ConfigValidator().validate(config);
    RFPROF_CHECK(result.is_valid);
    RFPROF_CHECK(!result.warnings.empty());
    return true;
}

bool number_and_phase_lists() {
    RFPROF_CHECK((CommandLineInterface::parse_number_list("0, 90,180 ,270") ==
                  std::vector<double>{0.0, 90.0, 180.0, 270.0}));
    RFPROF_CHECK(CommandLineInterface::parse_number_list("").empty());
    RFPROF_CHECK_THROWS(CommandLineInterface::parse_number_list("0,ninety"), ConfigurationError);
    RFPROF_CHECK_THROWS(CommandLineInterface::parse_number_list("12abc"), ConfigurationError);

    RFPROF_CHECK((CommandLineInterface::parse_phase_list("Extraction, export") ==
                  std::set<Phase>{Phase::EXTRACTION, Phase::EXPORT}));
    RFPROF_CHECK(CommandLineInterface::parse_phase_list("all").size() == std::size(ALL_PHASES));
    RFPROF_CHECK_THROWS(CommandLineInterface::parse_phase_list("Extraction,Render"), ConfigurationError);
    return true;
}

bool command_line_overrides_config_file() {
    test::TempDir dir("rfprof_config");
    std::string path = dir.file("run.json");
    test::write_text(path, json{
        {"transmitter", {{"latitude", 8.0}, {"longitude", -12.0}}},
        {"receiver_generation", {{"azimuths_deg", {0.0, 180.0}}, {"max_distance_km", 4.0}}},
        {"landcover", {{"path", "lc.tif"}}},
        {"pipeline", {{"log_level", 2}}}
    }.dump());

    Argv args({"--config", path, "--lat", "-8.25", "-n", "12", "--force-refresh", "DataPrep",
               "--run-until=PointGeneration", "-j", "3", "--exclude-transmitter", "--log-level", "2"});
    CommandLineInterface cli;
    RFPROF_CHECK(cli.parse_arguments(args.argc(), args.argv()));

    const PipelineConfig& config = cli.get_config();
    RFPROF_CHECK(config.transmitter.latitude == -8.25);
    RFPROF_CHECK(config.transmitter.longitude == -12.0);
    RFPROF_CHECK(config.generation.max_distance_km == 4.0);
    RFPROF_CHECK(config.generation.num_azimuths == 12);
    RFPROF_CHECK(config.generation.azimuths_deg.empty());
    RFPROF_CHECK(config.landcover.path == "lc.tif");
    RFPROF_CHECK((config.pipeline.force_refresh == std::set<Phase>{Phase::DATA_PREP}));
    RFPROF_CHECK(config.pipeline.run_until == Phase::POINT_GENERATION);
    RFPROF_CHECK(config.pipeline.num_threads == 3);
    RFPROF_CHECK(!config.pipeline.include_transmitter_in_profiles);
    RFPROF_CHECK(config.pipeline.log_level == 2);
    RFPROF_CHECK(!cli.is_dry_run());
    return true;
}

bool command_line_errors_stop_the_run() {
    {
        Argv args({"--lat", "north", "--log-level", "2"});
        CommandLineInterface cli;
        RFPROF_CHECK(!cli.parse_arguments(args.argc(), args.argv()));
        RFPROF_CHECK(cli.exit_code() == 1);
    }
    {
        Argv args({"--run-until", "Render", "--log-level", "2"});
        CommandLineInterface cli;
        RFPROF_CHECK(!cli.parse_arguments(args.argc(), args.argv()));
        RFPROF_CHECK(cli.exit_code() == 1);
    }
    {
        Argv args({"--help"});
        CommandLineInterface cli;
        RFPROF_CHECK(!cli.parse_arguments(args.argc(), args.argv()));
        RFPROF_CHECK(cli.exit_code() == 0);
    }
    {
        test::TempDir dir("rfprof_config");
        std::string path = dir.file("default.json");
        Argv args({"--create-config", path});
        CommandLineInterface cli;
        RFPROF_CHECK(!cli.parse_arguments(args.argc(), args.argv()));
        RFPROF_CHECK(cli.exit_code() == 0);
        RFPROF_CHECK(std::filesystem::exists(path));
    }
    {
        Argv args({"--dry-run", "--landcover", "lc.tif", "--log-level", "2"});
        CommandLineInterface cli;
        RFPROF_CHECK(cli.parse_arguments(args.argc(), args.argv()));
        RFPROF_CHECK(cli.is_dry_run());
    }
    return true;
}

bool log_configuration_parses_facilities() {
    Logger::clearFacilityLevels();
    Logger::parseLogConfig("2,Extractor=5");
    RFPROF_CHECK(Logger::getFacilityLevel("Extractor") == LogLevel::DEBUG);
    RFPROF_CHECK(Logger::getFacilityLevel("PipelineCache") == LogLevel::WARNING);

    Logger::clearFacilityLevels();
    Logger::parseLogConfig("9");
    RFPROF_CHECK(Logger::getFacilityLevel("Extractor") == LogLevel::TRACE);
    Logger::parseLogConfig("0");
    RFPROF_CHECK(Logger::getFacilityLevel("Extractor") == LogLevel::ERROR);
    Logger::parseLogConfig("3");
    return true;
}

} // anonymous namespace

int main() {
    test::TestRunner runner;
    runner.run("sections_override_defaults", sections_override_defaults);
    runner.run("malformed_documents_are_configuration_errors", malformed_documents_are_configuration_errors);
    runner.run("saved_file_reloads_identically", saved_file_reloads_identically);
    runner.run("default_document_lists_every_section", default_document_lists_every_section);
    runner.run("validator_accepts_reference_run", validator_accepts_reference_run);
    runner.run("validator_collects_every_conflict", validator_collects_every_conflict);
    runner.run("validator_checks_land_cover_source", validator_checks_land_cover_source);
    runner.run("number_and_phase_lists", number_and_phase_lists);
    runner.run("command_line_overrides_config_file", command_line_overrides_config_file);
    runner.run("command_line_errors_stop_the_run", command_line_errors_stop_the_run);
    runner.run("log_configuration_parses_facilities", log_configuration_parses_facilities);
    return runner.result();
}
