/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for rf-profile-gen
 */

#pragma once

#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long, --long=value, -s short aliases, flags and default values.
 * Options are printed in registration order by show_help().
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, required, true, default_value));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false, false));
    }

    void add_section(const std::string& title) {
        order_.push_back("#" + title);
    }

    /**
     * @brief Parse command line arguments
     * @return false when help was shown or an argument was rejected
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        defaulted_.clear();
        help_requested_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                if (it->second.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || is_option_token(args_[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto alias = short_to_long_.find(short_name);
                if (alias == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = alias->second;
                if (options_[option_name].has_value) {
                    if (i + 1 >= args_.size() || is_option_token(args_[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
                defaulted_.push_back(name);
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /// True when the value came from the command line rather than a default
    bool was_given(const std::string& option_name) const {
        if (parsed_values_.find(option_name) == parsed_values_.end()) return false;
        for (const auto& name : defaulted_) {
            if (name == option_name) return false;
        }
        return true;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << program_name_ << " - " << description_ << "\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --config run.json\n";
        std::cout << "    " << program_name_ << " --create-config run.json\n";

        for (const auto& entry : order_) {
            if (entry.starts_with("#")) {
                std::cout << "\n" << entry.substr(1) << ":\n";
                continue;
            }
            print_help_line(options_.at(entry));
        }
        std::cout << "\n    -h, --help                    Show this help\n";
    }

private:
    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> order_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> defaulted_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;

    void register_option(const Option& option) {
        options_[option.long_name] = option;
        order_.push_back(option.long_name);
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    // Negative numbers are values, not options
    static bool is_option_token(const std::string& token) {
        if (!token.starts_with("-") || token.size() < 2) return false;
        char next = token[1];
        return !(std::isdigit(static_cast<unsigned char>(next)) || next == '.');
    }

    static void print_help_line(const Option& option) {
        std::string left = "    ";
        if (!option.short_name.empty()) {
            left += "-" + option.short_name + ", ";
        }
        left += "--" + option.long_name;
        if (option.has_value) {
            left += " VALUE";
        }
        if (left.size() < 34) {
            left.append(34 - left.size(), ' ');
        } else {
            left += "  ";
        }
        std::cout << left << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
};

} // namespace rfprof
