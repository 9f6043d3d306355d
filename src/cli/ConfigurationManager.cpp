/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the debris generator
 */

#include "ConfigurationManager.hpp"
#include <climits>
#include <cstdint>
#include <fstream>

using json = nlohmann::json;

namespace debris {

namespace {

// Type checks are done here so a wrong type names the key
void require(bool ok, const std::string& key, const char* expected) {
    if (!ok) {
        throw std::invalid_argument("key '" + key + "' must be " + expected);
    }
}

// Integer keys map to int fields; out-of-range values are rejected, not truncated
int require_int(const json& value, const std::string& key) {
    require(value.is_number_integer(), key, "an integer");
    if (value.is_number_unsigned()) {
        require(value.get<std::uint64_t>() <= static_cast<std::uint64_t>(INT_MAX), key,
                "an integer in int range");
        return static_cast<int>(value.get<std::uint64_t>());
    }
    const std::int64_t wide = value.get<std::int64_t>();
    require(wide >= INT_MIN && wide <= INT_MAX, key, "an integer in int range");
    return static_cast<int>(wide);
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename, DebrisConfig& config) {
    last_error_.clear();

    std::ifstream file(filename);
    if (!file.is_open()) {
        last_error_ = "Could not open config file: " + filename;
        return false;
    }

    try {
        json document;
        file >> document;
        return load_from_json(document, config);
    } catch (const json::exception& e) {
        last_error_ = "Error parsing JSON config file " + filename + ": " + e.what();
        return false;
    }
}

bool ConfigurationManager::load_from_json(const json& document, DebrisConfig& config) {
    last_error_.clear();

    if (!document.is_object()) {
        last_error_ = "Configuration must be a JSON object";
        return false;
    }

    DebrisConfig updated = config;
    try {
        if (document.contains("vertex_count")) {
            updated.vertex_count = require_int(document["vertex_count"], "vertex_count");
        }
        if (document.contains("characteristic_length_mm")) {
            const auto& value = document["characteristic_length_mm"];
            require(value.is_number(), "characteristic_length_mm", "a number");
            updated.characteristic_length_mm = value.get<double>();
        }
        if (document.contains("irregularity")) {
            const auto& value = document["irregularity"];
            require(value.is_number(), "irregularity", "a number");
            updated.irregularity = value.get<double>();
        }
        if (document.contains("seed")) {
            const auto& value = document["seed"];
            if (value.is_null()) {
                updated.seed.reset();
            } else {
                require(value.is_number_unsigned(), "seed", "a non-negative integer or null");
                updated.seed = value.get<std::uint64_t>();
            }
        }
        if (document.contains("max_attempts")) {
            updated.max_attempts = require_int(document["max_attempts"], "max_attempts");
        }
        if (document.contains("output_path")) {
            const auto& value = document["output_path"];
            require(value.is_string(), "output_path", "a string");
            updated.output_path = value.get<std::string>();
        }
        if (document.contains("ascii_stl")) {
            const auto& value = document["ascii_stl"];
            require(value.is_boolean(), "ascii_stl", "true or false");
            updated.ascii_stl = value.get<bool>();
        }
        if (document.contains("solid_name")) {
            const auto& value = document["solid_name"];
            require(value.is_string(), "solid_name", "a string");
            updated.solid_name = value.get<std::string>();
        }
    } catch (const std::invalid_argument& e) {
        last_error_ = std::string("Invalid configuration: ") + e.what();
        return false;
    }

    config = updated;
    return true;
}

json ConfigurationManager::to_json(const DebrisConfig& config) {
    json document;
    document["vertex_count"] = config.vertex_count;
    document["characteristic_length_mm"] = config.characteristic_length_mm;
    document["irregularity"] = config.irregularity;
    if (config.seed.has_value()) {
        document["seed"] = config.seed.value();
    } else {
        document["seed"] = nullptr;
    }
    document["max_attempts"] = config.max_attempts;
    document["output_path"] = config.output_path;
    document["ascii_stl"] = config.ascii_stl;
    document["solid_name"] = config.solid_name;
    return document;
}

bool ConfigurationManager::save_to_file(const std::string& filename, const DebrisConfig& config) {
    last_error_.clear();

    std::ofstream file(filename);
    if (!file.is_open()) {
        last_error_ = "Could not open " + filename + " for writing";
        return false;
    }
    file << to_json(config).dump(2) << std::endl;
    if (!file) {
        last_error_ = "Failed writing " + filename;
        return false;
    }
    return true;
}

} // namespace debris
