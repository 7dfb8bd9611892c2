/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file management for rf-profile-gen
 */

#pragma once

#include "rf_profile_generator.hpp"
#include "../core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace rfprof {

/**
 * @brief Loads and saves PipelineConfig as a sectioned JSON document
 *
 * Sections: transmitter, propagation, receiver_generation, elevation, landcover,
 * land_cover_tables, zones, pipeline. Every key is optional and falls back to the
 * default of the corresponding config struct.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @param filename Path to JSON configuration file
     * @throws ConfigurationError if the file cannot be read or a value has the wrong type
     */
    void load_from_file(const std::string& filename);

    /**
     * @brief Load configuration from an already parsed document
     * @throws ConfigurationError on malformed values
     */
    void load_from_json(const nlohmann::json& document);

    /**
     * @brief Save configuration to file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    nlohmann::json to_json() const;

    const PipelineConfig& get_config() const { return config_; }
    PipelineConfig& get_config() { return config_; }
    void set_config(const PipelineConfig& config) { config_ = config; }

    /// Documented default configuration as written by --create-config
    static nlohmann::json default_document();

private:
    PipelineConfig config_;
    Logger logger_{"ConfigurationManager"};

    void read_transmitter(const nlohmann::json& section, const nlohmann::json& propagation);
    void read_generation(const nlohmann::json& section);
    void read_elevation(const nlohmann::json& section);
    void read_land_cover(const nlohmann::json& section);
    void read_tables(const nlohmann::json& section);
    void read_zones(const nlohmann::json& section);
    void read_pipeline(const nlohmann::json& section);

    static int parse_polarization(const nlohmann::json& value);
};

} // namespace rfprof
