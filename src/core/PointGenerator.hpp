#pragma once

/**
 * @file PointGenerator.hpp
 * @brief Batch generation of receiver points on azimuth rays around a transmitter
 */

#include "rf_profile_generator.hpp"
#include <vector>

namespace rfprof {

/**
 * @brief Generates the complete receiver point set in one call
 *
 * Offsets are applied in the local UTM zone of the transmitter so every
 * ray has uniform metric spacing. Output order: the transmitter (id 0),
 * then one group per azimuth in list order, distance increasing within a group.
 */
class PointGenerator {
public:
    struct Parameters {
        double max_distance_km = 0.0;
        double distance_step_km = 0.0;
        std::vector<double> azimuths_deg;

        static Parameters from_config(const ReceiverGenerationConfig& config);
    };

    explicit PointGenerator(const Transmitter& transmitter);

    /**
     * @brief Produce transmitter + azimuths x distances points
     * @throws ConfigurationError before any point is produced if parameters are invalid
     */
    std::vector<ReceiverPoint> generate(const Parameters& params) const;

    /// Validation only; throws ConfigurationError naming every problem found
    static void validate(const Transmitter& transmitter, const Parameters& params);

    /// k * step for k = 1 .. floor(max / step), rounded to the nanometre
    static std::vector<double> distance_steps(double max_distance_km, double step_km);

    static std::vector<double> equally_spaced_azimuths(int count);

    /// UTM zone number 1..60 for a longitude
    static int utm_zone(double longitude);

    /// Expected size of generate()'s output
    static size_t expected_count(const Parameters& params);

private:
    Transmitter transmitter_;
};

} // namespace rfprof
