/**
 * @file ProfileBuilder.cpp
 * @brief Implementation of per-azimuth profile construction
 */

#include "ProfileBuilder.hpp"
#include "../core/Logger.hpp"
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace rfprof {

ProfileBuilder::ProfileBuilder(const Transmitter& transmitter, const Options& options)
    : transmitter_(transmitter), options_(options) {}

void ProfileBuilder::append_sample(Profile& profile, const EnrichedPoint& sample) const {
    profile.distances_km.push_back(sample.point.distance_km);
    profile.heights_m.push_back(static_cast<int>(std::lround(sample.elevation_m)));
    profile.roughness_m.push_back(sample.roughness_m);
    profile.categories.push_back(sample.category);
    profile.zones.push_back(sample.zone);
}

std::vector<Profile> ProfileBuilder::build(const std::vector<EnrichedPoint>& points) const {
    Logger logger("ProfileBuilder");

    const EnrichedPoint* tx_sample = nullptr;
    for (const auto& p : points) {
        if (p.point.is_transmitter()) {
            tx_sample = &p;
            break;
        }
    }
    if (options_.include_transmitter && !tx_sample) {
        throw std::runtime_error("profiles require the transmitter sample but none was extracted");
    }

    std::vector<Profile> profiles;
    std::set<double> finished_azimuths;
    Profile* current = nullptr;
    double last_distance = 0.0;

    for (const auto& p : points) {
        if (p.point.is_transmitter()) continue;

        double azimuth = p.point.azimuth_deg;
        if (!current || current->azimuth_deg != azimuth) {
            if (current) {
                finished_azimuths.insert(current->azimuth_deg);
            }
            if (finished_azimuths.count(azimuth)) {
                std::ostringstream oss;
                oss << "points of azimuth " << azimuth << " are not contiguous (rx_id " << p.point.id << ")";
                throw std::runtime_error(oss.str());
            }

            Profile profile;
            profile.frequency_ghz = transmitter_.frequency_ghz;
            profile.time_percentage = transmitter_.time_percentage;
            profile.tx_height_m = transmitter_.antenna_height_m;
            profile.rx_height_m = transmitter_.receiver_height_m;
            profile.polarization = transmitter_.polarization;
            profile.phi_t = transmitter_.latitude;
            profile.lam_t = transmitter_.longitude;
            profile.azimuth_deg = azimuth;
            profiles.push_back(std::move(profile));
            current = &profiles.back();

            if (options_.include_transmitter) {
                append_sample(*current, *tx_sample);
            }
            last_distance = -1.0;
        }

        if (!(p.point.distance_km > last_distance)) {
            std::ostringstream oss;
            oss << "distance does not increase along azimuth " << azimuth << " (rx_id " << p.point.id << ")";
            throw std::runtime_error(oss.str());
        }
        last_distance = p.point.distance_km;

        append_sample(*current, p);
        current->phi_r = p.point.position.lat;
        current->lam_r = p.point.position.lon;
    }

    logger.detailed("Built " + std::to_string(profiles.size()) + " profiles");
    return profiles;
}

} // namespace rfprof
