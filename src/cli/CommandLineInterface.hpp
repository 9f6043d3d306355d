/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the debris generator
 */

#pragma once

#include "debris_generator.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/DebrisMesh.hpp"
#include <functional>
#include <string>
#include <vector>

namespace debris {

/**
 * @brief Command line interface for parsing arguments and configuring the generator
 *
 * Values are applied in order: defaults, JSON config file, environment
 * (DEBRIS_LOG_LEVEL, DEBRIS_LOG_FILE), then command-line options.
 */
class CommandLineInterface {
public:
    /// Exit status for malformed arguments or configuration
    static constexpr int exit_argument_error = 1;
    static constexpr int exit_generation_error = 2;
    static constexpr int exit_export_error = 3;

    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if generation should proceed; otherwise see exit_code()
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Parse arguments without the program name
     */
    bool parse_arguments(const std::vector<std::string>& args);

    /**
     * @brief Get the parsed configuration
     * @return DebrisConfig object
     */
    const DebrisConfig& get_config() const { return config_; }

    /**
     * @brief Check if this is a dry run
     * @return true if dry run mode is enabled
     */
    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Process exit status when parse_arguments() returned false
     *
     * 0 after --help, --version or --create-config; exit_argument_error
     * otherwise.
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

    /**
     * @brief Generate and export one fragment with the parsed configuration
     *
     * The engine is seeded from the configured seed, or from
     * std::random_device when none is set.
     *
     * @return Process exit status
     */
    int run() const;

    /**
     * @brief Same as run(), drawing from the caller's engine
     */
    int run(RandomEngine& rng) const;

    /**
     * @brief Call generate up to max_attempts times on the same engine
     *
     * Only DegenerateGeometryError and InsufficientPointsError lead to another
     * draw. The last failure is rethrown.
     */
    static MeshHandle generate_with_retries(
        const std::function<MeshHandle(RandomEngine&)>& generate,
        RandomEngine& rng, int max_attempts);

    /**
     * @brief Run body, mapping an escaping exception to an exit status
     *
     * InvalidParameterError gives exit_argument_error, any other
     * GenerationError exit_generation_error, ExportError exit_export_error
     * and anything else 1.
     */
    static int run_guarded(const std::function<int()>& body);

private:
    DebrisConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void register_options(SimpleCommandLineParser& parser) const;

    // Main parsing method
    bool parse_all_options(const SimpleCommandLineParser& parser);
    bool parse_logging_options(const SimpleCommandLineParser& parser);

    template<typename T>
    bool parse_number(const SimpleCommandLineParser& parser, const std::string& name, T& target);
    bool parse_seed(const std::string& text);

    bool fail(const std::string& message);
};

} // namespace debris
