/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser to avoid CLI11 dependency issues
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace debris {

/**
 * @brief Simple command-line argument parser
 *
 * A lightweight alternative to CLI11 providing long/short options, flags,
 * --option=value syntax and typed lookups. Negative numbers are accepted as
 * option values.
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

    // Add command line options
    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    // Parse command line arguments
    bool parse(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        return parse(args);
    }

    /**
     * @brief Parse arguments without the program name
     * @return false on help request or error; see help_requested() and last_error()
     */
    bool parse(const std::vector<std::string>& args) {
        args_ = args;
        parsed_values_.clear();
        positional_args_.clear();
        last_error_.clear();
        help_requested_ = false;

        // Check for help request
        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                return false;
            }
        }

        // Parse arguments
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
                    return fail("Unknown option: --" + option_name);
                }

                const auto& option = it->second;
                if (option.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || !is_value(args_[i + 1])) {
                            return fail("Option --" + option_name + " requires a value");
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    if (inline_value) {
                        return fail("Flag --" + option_name + " does not take a value");
                    }
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1 && !is_number(arg)) {
                std::string short_name = arg.substr(1);

                auto short_it = short_to_long_.find(short_name);
                if (short_it == short_to_long_.end()) {
                    return fail("Unknown option: -" + short_name);
                }

                const std::string& option_name = short_it->second;
                const auto& option = options_.at(option_name);

                if (option.has_value) {
                    if (i + 1 >= args_.size() || !is_value(args_[i + 1])) {
                        return fail("Option -" + short_name + " requires a value");
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                // Positional argument
                positional_args_.push_back(arg);
            }
        }

        // Check required options
        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                return fail("Required option --" + name + " not provided");
            }
        }

        // Set default values
        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool has(const std::string& option_name) const {
        return parsed_values_.find(option_name) != parsed_values_.end();
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    /**
     * @brief Typed lookup; nullopt if absent or if the whole value does not parse
     */
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if ((iss >> result) && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }
    const std::string& last_error() const { return last_error_; }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n\n";

        std::cout << "QUICK START:\n";
        std::cout << "    # 10-vertex, 10 mm fragment written to debris.stl\n";
        std::cout << "    " << program_name_ << "\n";
        std::cout << "    \n";
        std::cout << "    # Reproducible 50 mm fragment\n";
        std::cout << "    " << program_name_ << " -n 19 -l 50 -i 0.2 --seed 42 -o fragment.stl\n";
        std::cout << "    \n";
        std::cout << "    # Create and use a configuration file\n";
        std::cout << "    " << program_name_ << " --create-config debris.json\n";
        std::cout << "    " << program_name_ << " --config debris.json\n\n";

        std::cout << "GENERATION OPTIONS:\n";
        print_help_section("vertices", "Number of sampled points, 5 to 20 (default: 10)");
        print_help_section("length", "Characteristic length in mm, 1 to 100 (default: 10.0)");
        print_help_section("irregularity", "Gaussian noise on the unit sphere, 0 to 1 (default: 0.5)");
        print_help_section("seed", "Seed for reproducible output (default: random)");
        print_help_section("max-attempts", "Redraws allowed after degenerate geometry (default: 1)");
        std::cout << "\n";

        std::cout << "OUTPUT OPTIONS:\n";
        print_help_section("output", "STL output path (default: debris.stl)");
        print_help_section("ascii", "Write ASCII STL instead of binary");
        print_help_section("solid-name", "Solid name written to the STL (default: debris)");
        print_help_section("no-export", "Generate and report without writing a file");
        std::cout << "\n";

        std::cout << "CONFIGURATION & LOGGING:\n";
        print_help_section("config", "Load configuration from JSON file");
        print_help_section("create-config", "Create a default configuration file at the specified path");
        print_help_section("log-level", "Verbosity 0-6, or per component (e.g. \"3,ConvexHullBuilder=6\")");
        print_help_section("log-file", "Log to specified file (append if exists)");
        print_help_section("silent", "Suppress all output (same as --log-level 0)");
        print_help_section("verbose", "Enable verbose logging (same as --log-level 6)");
        print_help_section("dry-run", "Parse arguments and validate without generating");
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "HELP:\n";
        std::cout << "    -h, --help               Show this help\n";
    }

private:
    static bool is_number(const std::string& text) {
        std::istringstream iss(text);
        double value;
        return (iss >> value) && (iss >> std::ws).eof();
    }

    static bool is_value(const std::string& text) {
        return !text.starts_with("-") || is_number(text);
    }

    bool fail(const std::string& message) {
        last_error_ = message;
        std::cerr << message << std::endl;
        return false;
    }

    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::string usage = "    ";
            usage += option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
            usage += "--" + option.long_name;
            if (option.has_value) {
                usage += " VALUE";
            }
            if (usage.size() < 33) {
                usage.resize(33, ' ');
            } else {
                usage += "  ";
            }
            std::cout << usage << description << "\n";
        }
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    std::string last_error_;
    bool help_requested_ = false;
};

} // namespace debris
