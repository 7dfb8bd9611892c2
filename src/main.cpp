/**
 * @file main.cpp
 * @brief Main entry point for rf-profile-gen
 *
 * Generates per-azimuth terrain, land-cover and radio-climatic-zone profiles
 * around a transmitter for ITU-R P.1812 style propagation models.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "rf_profile_generator.hpp"
#include "core/ConfigValidator.hpp"
#include "core/Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include "version.h"
#include <chrono>
#include <iostream>

using namespace rfprof;

/**
 * @brief Print the outcome of each phase and the extraction anomalies
 */
void print_run_summary(const RunResult& result) {
    std::cout << "\n=== Run Summary ===\n";
    for (const auto& outcome : result.outcomes) {
        std::cout << "  " << phase_name(outcome.phase) << ": "
                  << (outcome.from_cache ? "cached" : "executed")
                  << " (" << outcome.duration_ms << "ms)\n";
    }
    if (result.profile_count > 0) {
        std::cout << "Profiles: " << result.profile_count << " -> " << result.profiles_csv << "\n";
        std::cout << "Points: " << result.points_geojson << "\n";
    }
    if (result.report.has_anomalies()) {
        std::cout << result.report.summary() << "\n";
    }
    std::cout << "===================\n";
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::steady_clock::now();

    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.exit_code();
    }

    const PipelineConfig& config = cli.get_config();
    Logger logger("main");

    if (config.pipeline.log_level >= 4) {
        cli.print_config();
    }

    if (cli.is_dry_run()) {
        ValidationResult validation = ConfigValidator().validate(config);
        for (const auto& warning : validation.warnings) {
            logger.warning(warning);
        }
        if (validation.has_errors()) {
            std::cerr << validation.format_error_message() << "\n";
            return 1;
        }
        logger.info("Dry run - configuration validated successfully");
        return 0;
    }

    try {
        logger.info("rf-profile-gen v" + std::string(RFPROF_VERSION_STRING));
        PipelineOrchestrator orchestrator(config);
        RunResult result = orchestrator.run();

        auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (config.pipeline.log_level >= 3) {
            print_run_summary(result);
        }
        logger.info("Completed in " + std::to_string(total_ms.count()) + "ms");
        return 0;

    } catch (const PipelineError& e) {
        logger.error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

// Example usage:
//
//   rf-profile-gen --create-config run.json
//   rf-profile-gen --config run.json
//   rf-profile-gen --lat 9.345 --lon -13.40694 --max-distance 11 --step 0.03 -n 36 \
//                  --landcover data/input/landcover/lcm10.tif --zones data/input/zones.geojson -j 4
//   rf-profile-gen --config run.json --force-refresh Extraction,Export
