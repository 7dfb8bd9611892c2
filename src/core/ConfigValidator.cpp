/**
 * @file ConfigValidator.cpp
 * @brief Implementation of configuration validation
 */

#include "ConfigValidator.hpp"
#include "Logger.hpp"
#include <cmath>
#include <algorithm>
#include <set>
#include <sstream>

namespace rfprof {

namespace {
    std::string format_value(double value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    void add(ValidationResult& result, std::optional<ParameterConflict> conflict) {
        if (conflict) {
            result.conflicts.push_back(std::move(*conflict));
            result.is_valid = false;
        }
    }
}

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "invalid parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }
    return oss.str();
}

std::optional<ParameterConflict> ConfigValidator::check_range(const std::string& name, double value,
                                                              double min, double max, const std::string& unit) {
    if (std::isfinite(value) && value >= min && value <= max) {
        return std::nullopt;
    }
    ParameterConflict conflict;
    conflict.description = name + " is outside its admissible range";
    conflict.involved_params = {name + " = " + format_value(value) + unit};
    conflict.suggestions = {"Use a value between " + format_value(min) + unit + " and " + format_value(max) + unit};
    return conflict;
}

ValidationResult ConfigValidator::validate(const PipelineConfig& config) const {
    ValidationResult result;
    check_transmitter(config.transmitter, result);
    check_generation(config.generation, result);
    check_elevation(config.elevation, result);
    check_land_cover(config, result);
    check_pipeline(config.pipeline, result);
    return result;
}

void ConfigValidator::validate_or_throw(const PipelineConfig& config) const {
    Logger logger("ConfigValidator");
    auto result = validate(config);
    for (const auto& warning : result.warnings) {
        logger.warning(warning);
    }
    if (result.has_errors()) {
        throw ConfigurationError(result.format_error_message());
    }
    logger.debug("Configuration validated");
}

void ConfigValidator::check_transmitter(const Transmitter& tx, ValidationResult& result) const {
    if (tx.id.empty()) {
        ParameterConflict conflict;
        conflict.description = "Transmitter id is empty";
        conflict.involved_params = {"transmitter.tx_id"};
        conflict.suggestions = {"Set transmitter.tx_id, e.g. \"TX_0001\""};
        add(result, conflict);
    }

    // Point generation projects through the transmitter's UTM zone
    add(result, check_range("transmitter.latitude", tx.latitude, -84.0, 84.0, " deg"));
    add(result, check_range("transmitter.longitude", tx.longitude, -180.0, 180.0, " deg"));
    add(result, check_range("transmitter.antenna_height_tx", tx.antenna_height_m, 1.0, 3000.0, " m"));
    add(result, check_range("transmitter.antenna_height_rx", tx.receiver_height_m, 1.0, 3000.0, " m"));
    add(result, check_range("propagation.frequency_ghz", tx.frequency_ghz, 0.03, 6.0, " GHz"));
    add(result, check_range("propagation.time_percentage", tx.time_percentage, 1.0, 50.0, " %"));

    if (tx.polarization != 1 && tx.polarization != 2) {
        ParameterConflict conflict;
        conflict.description = "Unknown polarization";
        conflict.involved_params = {"propagation.polarization = " + std::to_string(tx.polarization)};
        conflict.suggestions = {"Use 1 for horizontal", "Use 2 for vertical"};
        add(result, conflict);
    }
}

void ConfigValidator::check_generation(const ReceiverGenerationConfig& generation, ValidationResult& result) const {
    if (!(generation.distance_step_km > 0.0) || !std::isfinite(generation.distance_step_km)) {
        ParameterConflict conflict;
        conflict.description = "Distance step must be positive";
        conflict.involved_params = {"receiver_generation.distance_step_km = " +
                                    format_value(generation.distance_step_km)};
        conflict.suggestions = {"Use a step such as 0.03 km (30 m)"};
        add(result, conflict);
    } else if (!(generation.max_distance_km >= generation.distance_step_km)) {
        ParameterConflict conflict;
        conflict.description = "Maximum distance is shorter than one distance step";
        conflict.involved_params = {
            "receiver_generation.max_distance_km = " + format_value(generation.max_distance_km),
            "receiver_generation.distance_step_km = " + format_value(generation.distance_step_km)
        };
        conflict.suggestions = {
            "Use --max-distance " + format_value(generation.distance_step_km) + " or more",
            "Use --step " + format_value(generation.max_distance_km) + " or less"
        };
        add(result, conflict);
    }

    if (generation.azimuths_deg.empty() && generation.num_azimuths <= 0) {
        ParameterConflict conflict;
        conflict.description = "No azimuths to sample";
        conflict.involved_params = {"receiver_generation.num_azimuths = " + std::to_string(generation.num_azimuths),
                                    "receiver_generation.azimuths_deg = []"};
        conflict.suggestions = {"Set num_azimuths > 0 (36 gives 10 degree spacing)",
                                "List explicit azimuths in azimuths_deg"};
        add(result, conflict);
    }

    std::set<double> seen;
    for (double azimuth : generation.azimuths_deg) {
        if (!std::isfinite(azimuth) || azimuth < 0.0 || azimuth >= 360.0) {
            ParameterConflict conflict;
            conflict.description = "Azimuth outside [0, 360)";
            conflict.involved_params = {"receiver_generation.azimuths_deg contains " + format_value(azimuth)};
            conflict.suggestions = {"Normalize azimuths to [0, 360)"};
            add(result, conflict);
        } else if (!seen.insert(azimuth).second) {
            ParameterConflict conflict;
            conflict.description = "Duplicate azimuth";
            conflict.involved_params = {"receiver_generation.azimuths_deg lists " + format_value(azimuth) + " twice"};
            conflict.suggestions = {"Remove the duplicate entry"};
            add(result, conflict);
        }
    }

    if (generation.distance_step_km > 0.0 && generation.max_distance_km >= generation.distance_step_km) {
        double per_ray = std::floor(generation.max_distance_km / generation.distance_step_km + 1e-9);
        size_t rays = generation.azimuths_deg.empty() ? static_cast<size_t>(std::max(0, generation.num_azimuths))
                                                      : generation.azimuths_deg.size();
        if (per_ray * static_cast<double>(rays) > 5e6) {
            result.warnings.push_back("Receiver generation produces " +
                                      format_value(per_ray * static_cast<double>(rays)) +
                                      " points; extraction memory grows linearly with this count");
        }
    }
}

void ConfigValidator::check_elevation(const ElevationConfig& elevation, ValidationResult& result) const {
    if (!(elevation.min_m < elevation.max_m)) {
        ParameterConflict conflict;
        conflict.description = "Elevation admissible range is empty";
        conflict.involved_params = {"elevation.min_m = " + format_value(elevation.min_m),
                                    "elevation.max_m = " + format_value(elevation.max_m)};
        conflict.suggestions = {"Use the defaults min_m = -500, max_m = 9000"};
        add(result, conflict);
    }
    if (elevation.margin_km < 0.0) {
        add(result, check_range("elevation.margin_km", elevation.margin_km, 0.0, 1000.0, " km"));
    }
    if (elevation.tile_cache_dir.empty()) {
        ParameterConflict conflict;
        conflict.description = "No DEM tile directory configured";
        conflict.involved_params = {"elevation.tile_cache_dir"};
        conflict.suggestions = {"Set elevation.tile_cache_dir, e.g. \"data/input/dem_tiles\""};
        add(result, conflict);
    }
    if (elevation.fallback_m < elevation.min_m || elevation.fallback_m > elevation.max_m) {
        result.warnings.push_back("elevation.fallback_m = " + format_value(elevation.fallback_m) +
                                  " lies outside the admissible range");
    }
}

void ConfigValidator::check_land_cover(const PipelineConfig& config, ValidationResult& result) const {
    const auto& lc = config.landcover;

    if (lc.provider != "file" && lc.provider != "sentinel-hub") {
        ParameterConflict conflict;
        conflict.description = "Unknown land-cover provider";
        conflict.involved_params = {"landcover.provider = \"" + lc.provider + "\""};
        conflict.suggestions = {"Use \"file\" with landcover.path", "Use \"sentinel-hub\" with a collection_id"};
        add(result, conflict);
    } else if (lc.provider == "file" && lc.required && lc.path.empty()) {
        ParameterConflict conflict;
        conflict.description = "Land cover is required but no raster is configured";
        conflict.involved_params = {"landcover.provider = \"file\"", "landcover.path = \"\"",
                                    "landcover.required = true"};
        conflict.suggestions = {"Set landcover.path to a land-cover GeoTIFF",
                                "Set landcover.required = false to use the nodata code everywhere"};
        add(result, conflict);
    } else if (lc.provider == "sentinel-hub" && lc.collection_id.empty()) {
        ParameterConflict conflict;
        conflict.description = "Sentinel Hub provider needs a BYOC collection id";
        conflict.involved_params = {"landcover.collection_id = \"\""};
        conflict.suggestions = {"Set landcover.collection_id"};
        add(result, conflict);
    }

    if (lc.chip_px <= 0) {
        add(result, check_range("landcover.chip_px", lc.chip_px, 1.0, 10000.0, " px"));
    }
    if (!(lc.buffer_m > 0.0)) {
        add(result, check_range("landcover.buffer_m", lc.buffer_m, 1.0, 1e6, " m"));
    } else if (lc.buffer_m < config.generation.max_distance_km * 1000.0) {
        result.warnings.push_back("landcover.buffer_m = " + format_value(lc.buffer_m) +
                                  " m is smaller than max_distance_km; outer points get the nodata code");
    }
}

void ConfigValidator::check_pipeline(const PipelineSettings& pipeline, ValidationResult& result) const {
    if (pipeline.num_threads < 1) {
        ParameterConflict conflict;
        conflict.description = "Thread count must be at least 1";
        conflict.involved_params = {"pipeline.num_threads = " + std::to_string(pipeline.num_threads)};
        conflict.suggestions = {"Use --threads 1 for sequential extraction"};
        add(result, conflict);
    }
    if (pipeline.max_retries < 1) {
        ParameterConflict conflict;
        conflict.description = "Retry count must be at least 1";
        conflict.involved_params = {"pipeline.max_retries = " + std::to_string(pipeline.max_retries)};
        conflict.suggestions = {"Use the default of 3"};
        add(result, conflict);
    }
    if (pipeline.cache_dir.empty() || pipeline.output_dir.empty() || pipeline.base_name.empty()) {
        ParameterConflict conflict;
        conflict.description = "Cache directory, output directory and base name must be set";
        conflict.involved_params = {"pipeline.cache_dir = \"" + pipeline.cache_dir + "\"",
                                    "pipeline.output_dir = \"" + pipeline.output_dir + "\"",
                                    "pipeline.base_name = \"" + pipeline.base_name + "\""};
        add(result, conflict);
    }
}

} // namespace rfprof
