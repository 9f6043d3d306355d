/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration files for the debris generator
 */

#pragma once

#include "debris_generator.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace debris {

/**
 * @brief Loads and saves DebrisConfig as JSON
 *
 * Recognized keys: vertex_count, characteristic_length_mm, irregularity,
 * seed (number or null), output_path, ascii_stl, solid_name, max_attempts.
 * Keys absent from a file leave the corresponding field unchanged.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file into config
     * @param filename Path to configuration file
     * @param config Updated in place; unchanged on failure
     * @return true if successful, false otherwise (see last_error())
     */
    bool load_from_file(const std::string& filename, DebrisConfig& config);

    /**
     * @brief Apply a parsed JSON document to config
     * @return true if every recognized key had the right type
     */
    bool load_from_json(const nlohmann::json& document, DebrisConfig& config);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @param config Values to write
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename, const DebrisConfig& config);

    /**
     * @brief Write the default configuration
     */
    bool create_default_config_file(const std::string& filename) {
        return save_to_file(filename, DebrisConfig{});
    }

    static nlohmann::json to_json(const DebrisConfig& config);

    const std::string& last_error() const { return last_error_; }

private:
    std::string last_error_;
};

} // namespace debris
