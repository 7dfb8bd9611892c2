/**
 * @file ProfileCsvExporter.cpp
 * @brief Implementation of profile CSV export
 */

#include "ProfileCsvExporter.hpp"
#include "../core/JsonSerialization.hpp"
#include "../core/Logger.hpp"
#include <sstream>

namespace rfprof {

ProfileCsvExporter::ProfileCsvExporter() : options_() {}

ProfileCsvExporter::ProfileCsvExporter(const Options& options) : options_(options) {}

const std::vector<std::string>& ProfileCsvExporter::columns() {
    static const std::vector<std::string> names = {
        "f", "p", "d", "h", "R", "Ct", "zone", "htg", "hrg", "pol",
        "phi_t", "phi_r", "lam_t", "lam_r", "azimuth"
    };
    return names;
}

std::string ProfileCsvExporter::format_number(double value) const {
    std::ostringstream oss;
    oss.precision(options_.precision);
    oss << value;
    return oss.str();
}

template <typename T>
std::string ProfileCsvExporter::format_array(const std::vector<T>& values) const {
    std::ostringstream oss;
    oss.precision(options_.precision);
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

std::string ProfileCsvExporter::to_csv_string(const std::vector<Profile>& profiles) const {
    std::ostringstream csv;
    const char sep = options_.delimiter;

    const auto& names = columns();
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) csv << sep;
        csv << names[i];
    }
    csv << "\n";

    for (const auto& profile : profiles) {
        csv << format_number(profile.frequency_ghz) << sep
            << format_number(profile.time_percentage) << sep
            << format_array(profile.distances_km) << sep
            << format_array(profile.heights_m) << sep
            << format_array(profile.roughness_m) << sep
            << format_array(profile.categories) << sep
            << format_array(profile.zones) << sep
            << format_number(profile.tx_height_m) << sep
            << format_number(profile.rx_height_m) << sep
            << profile.polarization << sep
            << format_number(profile.phi_t) << sep
            << format_number(profile.phi_r) << sep
            << format_number(profile.lam_t) << sep
            << format_number(profile.lam_r) << sep
            << format_number(profile.azimuth_deg) << "\n";
    }
    return csv.str();
}

void ProfileCsvExporter::export_csv(const std::vector<Profile>& profiles, const std::string& filename) const {
    Logger logger("ProfileCsvExporter");
    write_text_atomic(filename, to_csv_string(profiles));
    logger.info("Exported " + std::to_string(profiles.size()) + " profiles: " + filename);
}

} // namespace rfprof
