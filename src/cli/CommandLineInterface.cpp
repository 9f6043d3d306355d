/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "ExportOrchestrator.hpp"
#include "../core/InputValidator.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>

namespace debris {

namespace {

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Sampling: " << metrics.sampling_time.count() << "us\n";
    std::cout << "Scaling: " << metrics.scaling_time.count() << "us\n";
    std::cout << "Convex hull: " << metrics.hull_time.count() << "us\n";
    std::cout << "Packaging: " << metrics.packaging_time.count() << "us\n";
    std::cout << "Total time: " << metrics.total_time.count() << "us\n";
    std::cout << "Points sampled: " << metrics.points_sampled << "\n";
    std::cout << "Interior points dropped: " << metrics.points_discarded() << "\n";
    std::cout << "Scale factor: " << metrics.scale_factor << " mm/unit\n";
    std::cout << "============================\n";
}

/**
 * @brief Print mesh validation results
 */
void print_validation_results(const MeshValidationResult& result) {
    std::cout << "\n=== Mesh Validation Results ===\n";
    std::cout << "Manifold: " << (result.is_manifold ? "YES" : "NO") << "\n";
    std::cout << "Watertight: " << (result.is_watertight ? "YES" : "NO") << "\n";
    std::cout << "Euler characteristic: " << result.euler_characteristic << "\n";

    if (result.num_non_manifold_edges > 0) {
        std::cout << "Non-manifold edges: " << result.num_non_manifold_edges << "\n";
    }
    if (result.num_degenerate_triangles > 0) {
        std::cout << "Degenerate triangles: " << result.num_degenerate_triangles << "\n";
    }
    if (result.num_duplicate_vertices > 0) {
        std::cout << "Duplicate vertices: " << result.num_duplicate_vertices << "\n";
    }
    std::cout << "===============================\n";
}

void print_fragment_summary(const MeshHandle& handle) {
    const double achieved = handle.achieved_characteristic_length();
    const BoundingBox bbox = handle.mesh().compute_bounding_box();

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Actual max distance: " << achieved << " mm (" << achieved / 10.0 << " cm)\n";
    std::cout << "Hull: " << handle.vertices().size() << " vertices, "
              << handle.triangles().size() << " faces\n";
    std::cout << "Bounding box: " << bbox.width() << " x " << bbox.depth() << " x "
              << bbox.height() << " mm\n";
    std::cout << std::defaultfloat;
}

} // namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return parse_arguments(args);
}

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    // Configuration file options
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create default configuration file at path");

    // Generation options
    parser.add_option("vertices", "n", "Number of points sampled on the sphere (5-20)");
    parser.add_option("length", "l", "Characteristic length in mm (1-100)");
    parser.add_option("irregularity", "i", "Standard deviation of the per-axis noise (0-1)");
    parser.add_option("seed", "", "Seed for the random engine");
    parser.add_option("max-attempts", "", "Attempts allowed when a draw is degenerate");

    // Output options
    parser.add_option("output", "o", "STL output path");
    parser.add_flag("ascii", "", "Write ASCII STL");
    parser.add_option("solid-name", "", "Solid name for the STL file");
    parser.add_flag("no-export", "", "Skip writing the STL file");

    // Logging and utility options
    parser.add_flag("silent", "s", "Suppress all output (same as --log-level 0)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE\n"
                                       "                Supports facility-specific: \"3,ConvexHullBuilder=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");
}

bool CommandLineInterface::parse_arguments(const std::vector<std::string>& args) {
    config_ = DebrisConfig{};
    dry_run_ = false;
    exit_code_ = 0;

    SimpleCommandLineParser parser("debris-gen",
        "Generate a random convex debris fragment as an STL mesh\n"
        "\n"
        "Points are sampled on a noisy unit sphere, scaled so the largest\n"
        "distance between any two equals the characteristic length, and\n"
        "wrapped in their convex hull.");
    register_options(parser);

    if (!parser.parse(args)) {
        if (parser.help_requested()) {
            parser.show_help();
            exit_code_ = 0;
        } else {
            exit_code_ = exit_argument_error;
        }
        return false;
    }

    if (!parser.get_positional().empty()) {
        return fail("Unexpected argument: " + parser.get_positional().front());
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "Debris Generator v" << DEBRIS_VERSION_STRING << std::endl;
        std::cout << "Random convex fragment meshes for impact and debris studies" << std::endl;
        std::cout << "Built with CGAL, Eigen, nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 The DebrisGenerator Authors" << std::endl;
        return false;
    }

    // Handle create-config option
    if (auto config_path = parser.get("create-config")) {
        ConfigurationManager manager;
        if (!manager.create_default_config_file(config_path.value())) {
            return fail(manager.last_error());
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    // Load configuration file if specified
    if (auto config_file = parser.get("config")) {
        ConfigurationManager manager;
        if (!manager.load_from_file(config_file.value(), config_)) {
            return fail("Failed to load configuration file: " + config_file.value() + "\n  " +
                        manager.last_error());
        }
        config_.config_file = config_file.value();
    }

    return parse_all_options(parser);
}

template<typename T>
bool CommandLineInterface::parse_number(const SimpleCommandLineParser& parser,
                                        const std::string& name, T& target) {
    if (!parser.has(name)) {
        return true;
    }
    auto value = parser.get_as<T>(name);
    if (!value.has_value()) {
        return fail("Invalid value for --" + name + ": '" + parser.get(name).value_or("") + "'");
    }
    target = value.value();
    return true;
}

bool CommandLineInterface::parse_seed(const std::string& text) {
    bool all_digits = !text.empty() &&
        std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!all_digits) {
        return fail("Invalid value for --seed: '" + text + "' (expected a non-negative integer)");
    }
    try {
        config_.seed = static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return fail("Invalid value for --seed: '" + text + "' (out of range)");
    }
    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Generation parameters; ranges are checked later by InputValidator
    if (!parse_number(parser, "vertices", config_.vertex_count)) return false;
    if (!parse_number(parser, "length", config_.characteristic_length_mm)) return false;
    if (!parse_number(parser, "irregularity", config_.irregularity)) return false;
    if (!parse_number(parser, "max-attempts", config_.max_attempts)) return false;

    if (auto value = parser.get("seed")) {
        if (!parse_seed(value.value())) return false;
    }

    if (config_.max_attempts < 1) {
        return fail("--max-attempts must be at least 1");
    }

    // Output options
    if (auto value = parser.get("output")) config_.output_path = value.value();
    if (auto value = parser.get("solid-name")) config_.solid_name = value.value();
    if (parser.get_flag("ascii")) config_.ascii_stl = true;
    if (parser.get_flag("no-export")) config_.export_enabled = false;

    if (config_.export_enabled && config_.output_path.empty()) {
        return fail("Output path must not be empty");
    }

    if (!parse_logging_options(parser)) return false;

    // Utility flags
    dry_run_ = parser.get_flag("dry-run");
    return true;
}

bool CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Logging options with priority: CLI > ENV > defaults
    // 1. Check environment variable first
    const char* env_log_level = std::getenv("DEBRIS_LOG_LEVEL");
    if (env_log_level) {
        if (!Logger::parseLogConfig(env_log_level)) {
            std::cerr << "Warning: ignoring invalid DEBRIS_LOG_LEVEL" << std::endl;
        } else {
            config_.log_levels = std::string(env_log_level);
        }
    }

    // 2. CLI arguments override environment
    if (auto value = parser.get("log-level")) {
        if (!Logger::parseLogConfig(value.value())) {
            return fail("Invalid --log-level: '" + value.value() + "'");
        }
        config_.log_levels = value.value();
    }

    // 3. Flags override everything
    if (parser.get_flag("silent")) {
        Logger::setDefaultLevel(LogLevel::ERROR);  // ERROR level minimum
        config_.log_level = 0;
    } else if (parser.get_flag("verbose")) {
        Logger::setDefaultLevel(LogLevel::TRACE);
        config_.log_level = 6;
    } else {
        config_.log_level = static_cast<int>(Logger::getDefaultLevel());
    }

    // 4. Log file configuration
    const char* env_log_file = std::getenv("DEBRIS_LOG_FILE");
    if (env_log_file) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();  // CLI overrides environment
    }
    return true;
}

bool CommandLineInterface::fail(const std::string& message) {
    std::cerr << "Error: " << message << std::endl;
    exit_code_ = exit_argument_error;
    return false;
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // Only print at DETAILED level or higher

    std::cout << "\n=== Configuration ===\n";
    std::cout << "Vertices: " << config_.vertex_count << "\n";
    std::cout << "Characteristic length: " << config_.characteristic_length_mm << "mm\n";
    std::cout << "Irregularity: " << config_.irregularity << "\n";
    std::cout << "Seed: " << (config_.seed ? std::to_string(*config_.seed) : "random") << "\n";
    std::cout << "Max attempts: " << config_.max_attempts << "\n";
    if (config_.export_enabled) {
        std::cout << "Output: " << config_.output_path
                  << (config_.ascii_stl ? " (ASCII STL)" : " (binary STL)") << "\n";
    } else {
        std::cout << "Output: disabled\n";
    }
    if (config_.config_file) {
        std::cout << "Config file: " << *config_.config_file << "\n";
    }
    std::cout << "===================\n\n";
}

int CommandLineInterface::run() const {
    RandomEngine rng(config_.seed.has_value() ? config_.seed.value()
                                              : static_cast<std::uint64_t>(std::random_device{}()));
    if (config_.seed) {
        Logger("CommandLineInterface").detailed("Using seed " + std::to_string(*config_.seed));
    }
    return run(rng);
}

int CommandLineInterface::run(RandomEngine& rng) const {
    return run_guarded([this, &rng]() -> int {
        auto start_time = std::chrono::high_resolution_clock::now();

        // Print banner only if not silent
        if (config_.log_level > 0) {
            std::cout << "Debris Generator v" << DEBRIS_VERSION_STRING << "\n";
        }

        print_config();

        const GenerationParameters parameters = config_.to_parameters();
        InputValidator validator;
        auto validation = validator.validate(parameters);
        if (validation.has_errors()) {
            std::cerr << validation.format_error_message();
            return exit_argument_error;
        }

        if (dry_run_) {
            if (config_.log_level > 0) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return 0;
        }

        // Only the most recent fragment is kept
        std::optional<MeshHandle> current_mesh;

        DebrisGenerator generator(parameters);
        current_mesh = generate_with_retries(
            [&generator](RandomEngine& engine) { return generator.generate(engine); },
            rng, config_.max_attempts);

        if (config_.log_level > 0) {
            print_fragment_summary(*current_mesh);
        }

        if (config_.export_enabled) {
            ExportOrchestrator exporter(ExportSettings::from_config(config_));
            exporter.export_mesh(current_mesh);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        if (config_.log_level >= 4) {
            print_performance_summary(generator.get_metrics());
            print_validation_results(generator.get_validation_result());
        }

        if (config_.log_level > 0) {
            std::cout << "\nFragment generated successfully in "
                      << total_duration.count() << "ms\n";
        }
        return 0;
    });
}

MeshHandle CommandLineInterface::generate_with_retries(
    const std::function<MeshHandle(RandomEngine&)>& generate,
    RandomEngine& rng, int max_attempts) {
    Logger logger("CommandLineInterface");

    for (int attempt = 1; ; ++attempt) {
        try {
            return generate(rng);
        } catch (const DegenerateGeometryError& e) {
            if (attempt >= max_attempts) {
                throw;
            }
            logger.warning("Attempt " + std::to_string(attempt) + " of " +
                           std::to_string(max_attempts) + " was degenerate (" + e.what() +
                           "), drawing again");
        } catch (const InsufficientPointsError& e) {
            if (attempt >= max_attempts) {
                throw;
            }
            logger.warning("Attempt " + std::to_string(attempt) + " of " +
                           std::to_string(max_attempts) + " failed (" + e.what() +
                           "), drawing again");
        }
    }
}

int CommandLineInterface::run_guarded(const std::function<int()>& body) {
    try {
        return body();
    } catch (const InvalidParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return exit_argument_error;
    } catch (const GenerationError& e) {
        std::cerr << "Generation failed: " << e.what() << "\n";
        return exit_generation_error;
    } catch (const ExportError& e) {
        std::cerr << "Export failed: " << e.what() << "\n";
        return exit_export_error;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace debris
