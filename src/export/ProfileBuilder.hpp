/**
 * @file ProfileBuilder.hpp
 * @brief Groups enriched points into one propagation profile per azimuth
 */

#pragma once

#include "rf_profile_generator.hpp"
#include <vector>

namespace rfprof {

/**
 * @brief Builds Profile records from extraction output
 *
 * Relies on the generator's ordering: points of one azimuth are contiguous
 * with increasing distance. Groups are emitted in input order. Ordering
 * violations (a repeated azimuth group or a non-increasing distance) throw
 * std::runtime_error instead of being silently re-sorted.
 */
class ProfileBuilder {
public:
    struct Options {
        bool include_transmitter = true;  ///< prepend the d = 0 transmitter sample to every profile
    };

    ProfileBuilder(const Transmitter& transmitter, const Options& options);

    std::vector<Profile> build(const std::vector<EnrichedPoint>& points) const;

private:
    Transmitter transmitter_;
    Options options_;

    void append_sample(Profile& profile, const EnrichedPoint& sample) const;
};

} // namespace rfprof
