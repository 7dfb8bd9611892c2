/**
 * @file ConfigValidator.hpp
 * @brief One-shot validation of a run configuration before any work begins
 *
 * Collects every invalid or contradictory parameter and reports them together
 * with suggested corrections.
 */

#pragma once

#include "rf_profile_generator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Represents an invalid parameter or a conflict between parameters
 */
struct ParameterConflict {
    std::string description;                   // What is wrong
    std::vector<std::string> involved_params;  // Parameters involved, with their values
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of configuration validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;
    std::vector<std::string> warnings;  // Legal but suspicious settings

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Validates a PipelineConfig
 */
class ConfigValidator {
public:
    ConfigValidator() = default;

    ValidationResult validate(const PipelineConfig& config) const;

    /**
     * @brief Validate and log warnings
     * @throws ConfigurationError carrying the formatted conflict list
     */
    void validate_or_throw(const PipelineConfig& config) const;

private:
    void check_transmitter(const Transmitter& tx, ValidationResult& result) const;
    void check_generation(const ReceiverGenerationConfig& generation, ValidationResult& result) const;
    void check_elevation(const ElevationConfig& elevation, ValidationResult& result) const;
    void check_land_cover(const PipelineConfig& config, ValidationResult& result) const;
    void check_pipeline(const PipelineSettings& pipeline, ValidationResult& result) const;

    /// Conflict when value lies outside [min, max]
    static std::optional<ParameterConflict> check_range(const std::string& name, double value,
                                                        double min, double max, const std::string& unit);
};

} // namespace rfprof
