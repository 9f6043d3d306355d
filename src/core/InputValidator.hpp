/**
 * @file InputValidator.hpp
 * @brief Range validation for generation parameters
 *
 * Collects every out-of-range field with the bound it violates, so the front
 * end can show all problems at once before generation is attempted.
 */

#pragma once

#include "debris_generator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace debris {

/**
 * @brief A single parameter outside its documented range
 */
struct ParameterViolation {
    std::string field;        // Parameter name, e.g. "vertex_count"
    std::string bound;        // Allowed range, e.g. "[5, 20]"
    std::string value;        // Offending value as text
    std::string suggestion;   // How to fix it
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ParameterViolation> violations;

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;

    /**
     * @brief Throw InvalidParameterError for the first violation, if any
     *
     * The exception names the first offending field; its message lists all
     * violations.
     */
    void throw_if_invalid() const;
};

/**
 * @brief Validates generation parameters against their documented ranges
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all generation parameters
     * @param parameters Parameters to validate
     * @return Validation result with every violation found
     */
    ValidationResult validate(const GenerationParameters& parameters) const;

private:
    std::optional<ParameterViolation> check_vertex_count(const GenerationParameters& parameters) const;
    std::optional<ParameterViolation> check_characteristic_length(const GenerationParameters& parameters) const;
    std::optional<ParameterViolation> check_irregularity(const GenerationParameters& parameters) const;
};

} // namespace debris
