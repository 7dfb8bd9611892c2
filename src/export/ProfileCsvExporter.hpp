/**
 * @file ProfileCsvExporter.hpp
 * @brief Semicolon separated export of propagation profiles
 */

#pragma once

#include "rf_profile_generator.hpp"
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Writes one CSV row per profile
 *
 * Columns: f;p;d;h;R;Ct;zone;htg;hrg;pol;phi_t;phi_r;lam_t;lam_r;azimuth.
 * Array columns are rendered as "[a, b, c]".
 */
class ProfileCsvExporter {
public:
    struct Options {
        char delimiter = ';';
        int precision = 10;
    };

    ProfileCsvExporter();
    explicit ProfileCsvExporter(const Options& options);

    /**
     * @brief Write profiles atomically
     * @throws std::runtime_error on I/O failure
     */
    void export_csv(const std::vector<Profile>& profiles, const std::string& filename) const;

    std::string to_csv_string(const std::vector<Profile>& profiles) const;

    static const std::vector<std::string>& columns();

private:
    Options options_;

    template <typename T>
    std::string format_array(const std::vector<T>& values) const;
    std::string format_number(double value) const;
};

} // namespace rfprof
