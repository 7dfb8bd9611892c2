/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for rf-profile-gen
 */

#pragma once

#include "rf_profile_generator.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Parses arguments into a PipelineConfig and configures logging
 *
 * Precedence: built-in defaults, then the --config file, then command line
 * options. RFPROF_LOG_LEVEL and RFPROF_LOG_FILE apply when the matching
 * option is absent.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if a run should follow; false after help, version,
     *         --create-config or an error (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    const PipelineConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /// Process exit code to use when parse_arguments() returned false
    int exit_code() const { return exit_code_; }

    void print_config() const;

    static std::vector<double> parse_number_list(const std::string& text);
    static std::set<Phase> parse_phase_list(const std::string& text);

private:
    PipelineConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void register_options(SimpleCommandLineParser& parser) const;
    void apply_options(const SimpleCommandLineParser& parser);
    void configure_logging(const SimpleCommandLineParser& parser);

    bool create_default_config_file(const std::string& filename);
};

} // namespace rfprof
