/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <sstream>

namespace rfprof {

namespace {

std::optional<std::string> environment(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

template <typename T>
void apply_number(const SimpleCommandLineParser& parser, const std::string& name, T& target) {
    if (!parser.was_given(name)) return;
    auto value = parser.get_as<T>(name);
    if (!value) {
        throw ConfigurationError("--" + name + " expects a number, got '" + *parser.get(name) + "'");
    }
    target = *value;
}

void apply_string(const SimpleCommandLineParser& parser, const std::string& name, std::string& target) {
    if (parser.was_given(name)) {
        target = *parser.get(name);
    }
}

} // anonymous namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("rf-profile-gen",
        "Generate terrain, land-cover and radio-climatic-zone profiles around a transmitter");
    register_options(parser);

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 1;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "rf-profile-gen v" << RFPROF_VERSION_STRING << std::endl;
        std::cout << "Built with GDAL, libcurl, OpenSSL, zlib and nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        exit_code_ = 1;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        exit_code_ = create_default_config_file(*config_path) ? 0 : 1;
        return false;
    }

    try {
        if (auto config_file = parser.get("config")) {
            ConfigurationManager manager;
            manager.load_from_file(*config_file);
            config_ = manager.get_config();
        }
        apply_options(parser);
        configure_logging(parser);
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        exit_code_ = 1;
        return false;
    }

    dry_run_ = parser.get_flag("dry-run");
    return true;
}

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    parser.add_section("CONFIGURATION");
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Write a default configuration file to the given path and exit");

    parser.add_section("TRANSMITTER");
    parser.add_option("tx-id", "", "Transmitter identifier");
    parser.add_option("lon", "", "Transmitter longitude in decimal degrees");
    parser.add_option("lat", "", "Transmitter latitude in decimal degrees");
    parser.add_option("htg", "", "Transmitter antenna height above ground (m)");
    parser.add_option("hrg", "", "Receiver antenna height above ground (m)");
    parser.add_option("frequency", "f", "Frequency in GHz");
    parser.add_option("polarization", "", "1 = horizontal, 2 = vertical");
    parser.add_option("time-percentage", "p", "Time percentage (%)");

    parser.add_section("RECEIVER GENERATION");
    parser.add_option("max-distance", "", "Maximum distance from the transmitter (km)");
    parser.add_option("step", "", "Distance step (km)");
    parser.add_option("num-azimuths", "n", "Number of equally spaced azimuths");
    parser.add_option("azimuths", "", "Explicit azimuth list in degrees, e.g. \"0,90,180,270\"");

    parser.add_section("DATA SOURCES");
    parser.add_option("tile-dir", "", "Elevation tile cache directory");
    parser.add_flag("download-tiles", "", "Download missing elevation tiles");
    parser.add_option("landcover", "", "Land-cover raster (file provider)");
    parser.add_option("landcover-provider", "", "Land-cover provider: file or sentinel-hub");
    parser.add_flag("landcover-optional", "", "Continue with the nodata code when land cover is unavailable");
    parser.add_option("zones", "", "Zone polygon file (any OGR vector format)");

    parser.add_section("PIPELINE");
    parser.add_option("project-root", "", "Base directory for relative paths");
    parser.add_option("cache-dir", "", "Pipeline cache directory");
    parser.add_option("output-dir", "o", "Output directory");
    parser.add_option("base-name", "", "Base name of the exported files");
    parser.add_option("threads", "j", "Worker threads for extraction");
    parser.add_option("force-refresh", "", "Phases to re-run regardless of the cache, e.g. \"Extraction,Export\" or \"all\"");
    parser.add_option("run-until", "", "Stop after the named phase");
    parser.add_flag("exclude-transmitter", "", "Do not prepend the transmitter sample to each profile");
    parser.add_flag("dry-run", "", "Parse and validate arguments without processing");

    parser.add_section("LOGGING");
    parser.add_option("log-level", "", "1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "per facility: \"3,Extractor=5\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_flag("silent", "s", "Only report errors (same as --log-level 1)");
    parser.add_flag("version", "", "Show version information");
}

void CommandLineInterface::apply_options(const SimpleCommandLineParser& parser) {
    auto& tx = config_.transmitter;
    apply_string(parser, "tx-id", tx.id);
    apply_number(parser, "lon", tx.longitude);
    apply_number(parser, "lat", tx.latitude);
    apply_number(parser, "htg", tx.antenna_height_m);
    apply_number(parser, "hrg", tx.receiver_height_m);
    apply_number(parser, "frequency", tx.frequency_ghz);
    apply_number(parser, "polarization", tx.polarization);
    apply_number(parser, "time-percentage", tx.time_percentage);

    auto& gen = config_.generation;
    apply_number(parser, "max-distance", gen.max_distance_km);
    apply_number(parser, "step", gen.distance_step_km);
    if (parser.was_given("num-azimuths")) {
        apply_number(parser, "num-azimuths", gen.num_azimuths);
        gen.azimuths_deg.clear();
    }
    if (parser.was_given("azimuths")) {
        gen.azimuths_deg = parse_number_list(*parser.get("azimuths"));
    }

    apply_string(parser, "tile-dir", config_.elevation.tile_cache_dir);
    if (parser.get_flag("download-tiles")) {
        config_.elevation.download_missing = true;
    }

    apply_string(parser, "landcover", config_.landcover.path);
    apply_string(parser, "landcover-provider", config_.landcover.provider);
    if (parser.get_flag("landcover-optional")) {
        config_.landcover.required = false;
    }
    apply_string(parser, "zones", config_.zones.path);

    auto& p = config_.pipeline;
    apply_string(parser, "project-root", p.project_root);
    apply_string(parser, "cache-dir", p.cache_dir);
    apply_string(parser, "output-dir", p.output_dir);
    apply_string(parser, "base-name", p.base_name);
    apply_number(parser, "threads", p.num_threads);
    if (parser.was_given("force-refresh")) {
        p.force_refresh = parse_phase_list(*parser.get("force-refresh"));
    }
    if (parser.was_given("run-until")) {
        auto phase = parse_phase(*parser.get("run-until"));
        if (!phase) {
            throw ConfigurationError("--run-until: unknown phase '" + *parser.get("run-until") + "'");
        }
        p.run_until = phase;
    }
    if (parser.get_flag("exclude-transmitter")) {
        p.include_transmitter_in_profiles = false;
    }
}

void CommandLineInterface::configure_logging(const SimpleCommandLineParser& parser) {
    std::string log_config = std::to_string(config_.pipeline.log_level);
    if (parser.get_flag("silent")) {
        log_config = "1";
    } else if (parser.get_flag("verbose")) {
        log_config = "6";
    } else if (parser.was_given("log-level")) {
        log_config = *parser.get("log-level");
    } else if (auto env_level = environment("RFPROF_LOG_LEVEL")) {
        log_config = *env_level;
    }

    Logger::clearFacilityLevels();
    Logger::parseLogConfig(log_config);

    // First token without '=' is the default level
    std::string first = log_config.substr(0, log_config.find(','));
    if (first.find('=') == std::string::npos) {
        try {
            config_.pipeline.log_level = std::stoi(first);
        } catch (const std::exception&) {
            throw ConfigurationError("--log-level: invalid level '" + first + "'");
        }
    }

    if (parser.was_given("log-file")) {
        config_.pipeline.log_file = *parser.get("log-file");
    } else if (auto env_file = environment("RFPROF_LOG_FILE")) {
        config_.pipeline.log_file = *env_file;
    }
    Logger::setDefaultLogFile(config_.pipeline.log_file);
}

std::vector<double> CommandLineInterface::parse_number_list(const std::string& text) {
    std::vector<double> values;
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ',')) {
        token.erase(0, token.find_first_not_of(" \t"));
        token.erase(token.find_last_not_of(" \t") + 1);
        if (token.empty()) continue;

        size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(token, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed != token.size()) {
            throw ConfigurationError("invalid number '" + token + "' in list \"" + text + "\"");
        }
        values.push_back(value);
    }
    return values;
}

std::set<Phase> CommandLineInterface::parse_phase_list(const std::string& text) {
    std::set<Phase> phases;
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ',')) {
        token.erase(0, token.find_first_not_of(" \t"));
        token.erase(token.find_last_not_of(" \t") + 1);
        if (token.empty()) continue;

        if (token == "all") {
            phases.insert(std::begin(ALL_PHASES), std::end(ALL_PHASES));
            continue;
        }
        auto phase = parse_phase(token);
        if (!phase) {
            throw ConfigurationError("unknown phase '" + token + "'");
        }
        phases.insert(*phase);
    }
    return phases;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    ConfigurationManager manager;
    if (!manager.save_to_file(filename)) {
        std::cerr << "Failed to create configuration file: " << filename << std::endl;
        return false;
    }
    std::cout << "Created default configuration file: " << filename << std::endl;
    return true;
}

void CommandLineInterface::print_config() const {
    const auto& tx = config_.transmitter;
    const auto& gen = config_.generation;
    const auto& p = config_.pipeline;

    std::cout << "\n=== RF Profile Generator Configuration ===\n";
    std::cout << "Transmitter: " << tx.id << " at (" << tx.latitude << ", " << tx.longitude << ")\n";
    std::cout << "Antennas: htg " << tx.antenna_height_m << " m, hrg " << tx.receiver_height_m << " m\n";
    std::cout << "Radio: f " << tx.frequency_ghz << " GHz, p " << tx.time_percentage
              << " %, polarization " << (tx.polarization == 1 ? "horizontal" : "vertical") << "\n";
    std::cout << "Receivers: " << gen.max_distance_km << " km max, " << gen.distance_step_km << " km step, ";
    if (gen.azimuths_deg.empty()) {
        std::cout << gen.num_azimuths << " azimuths\n";
    } else {
        std::cout << gen.azimuths_deg.size() << " explicit azimuths\n";
    }
    std::cout << "Elevation tiles: " << config_.elevation.tile_cache_dir
              << (config_.elevation.download_missing ? " (download enabled)" : "") << "\n";
    std::cout << "Land cover: " << config_.landcover.provider;
    if (!config_.landcover.path.empty()) std::cout << " " << config_.landcover.path;
    std::cout << (config_.landcover.required ? "" : " (optional)") << "\n";
    std::cout << "Zones: " << (config_.zones.path.empty() ? "default zone " + std::to_string(config_.zones.default_zone)
                                                          : config_.zones.path) << "\n";
    std::cout << "Cache: " << p.cache_dir << "\n";
    std::cout << "Output: " << p.output_dir << "/" << p.base_name << "\n";
    std::cout << "Threads: " << p.num_threads << "\n";
    if (!p.force_refresh.empty()) {
        std::cout << "Forced phases:";
        for (Phase phase : p.force_refresh) std::cout << " " << phase_name(phase);
        std::cout << "\n";
    }
    if (p.run_until) {
        std::cout << "Run until: " << phase_name(*p.run_until) << "\n";
    }
    std::cout << "==========================================\n\n";
}

} // namespace rfprof
