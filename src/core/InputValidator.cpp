/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include <sstream>

namespace debris {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string format_range(double min_value, double max_value) {
    return "[" + format_number(min_value) + ", " + format_number(max_value) + "]";
}

} // namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || violations.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "Invalid generation parameters:\n";

    for (size_t i = 0; i < violations.size(); ++i) {
        const auto& violation = violations[i];
        oss << "  " << (i + 1) << ". " << violation.field << " = " << violation.value
            << " is outside " << violation.bound << "\n";
        if (!violation.suggestion.empty()) {
            oss << "     " << violation.suggestion << "\n";
        }
    }

    return oss.str();
}

void ValidationResult::throw_if_invalid() const {
    if (is_valid || violations.empty()) {
        return;
    }

    const auto& first = violations.front();
    throw InvalidParameterError(first.field, first.bound, format_error_message());
}

ValidationResult InputValidator::validate(const GenerationParameters& parameters) const {
    ValidationResult result;

    for (auto check : {&InputValidator::check_vertex_count,
                       &InputValidator::check_characteristic_length,
                       &InputValidator::check_irregularity}) {
        auto violation = (this->*check)(parameters);
        if (violation) {
            result.violations.push_back(*violation);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterViolation> InputValidator::check_vertex_count(
    const GenerationParameters& parameters) const {

    const int count = parameters.vertex_count();
    if (count >= GenerationParameters::min_vertex_count &&
        count <= GenerationParameters::max_vertex_count) {
        return std::nullopt;
    }

    ParameterViolation violation;
    violation.field = "vertex_count";
    violation.bound = "[" + std::to_string(GenerationParameters::min_vertex_count) + ", " +
                      std::to_string(GenerationParameters::max_vertex_count) + "]";
    violation.value = std::to_string(count);
    violation.suggestion = "Number of vertices must be between " +
                           std::to_string(GenerationParameters::min_vertex_count) + " and " +
                           std::to_string(GenerationParameters::max_vertex_count);
    return violation;
}

std::optional<ParameterViolation> InputValidator::check_characteristic_length(
    const GenerationParameters& parameters) const {

    const double length = parameters.characteristic_length_mm();
    // NaN fails both comparisons and is rejected
    if (length >= GenerationParameters::min_characteristic_length_mm &&
        length <= GenerationParameters::max_characteristic_length_mm) {
        return std::nullopt;
    }

    ParameterViolation violation;
    violation.field = "characteristic_length";
    violation.bound = format_range(GenerationParameters::min_characteristic_length_mm,
                                   GenerationParameters::max_characteristic_length_mm) + " mm";
    violation.value = format_number(length) + " mm";
    violation.suggestion = "Characteristic length must be between " +
                           format_number(GenerationParameters::min_characteristic_length_mm) +
                           " and " +
                           format_number(GenerationParameters::max_characteristic_length_mm) + " mm";
    return violation;
}

std::optional<ParameterViolation> InputValidator::check_irregularity(
    const GenerationParameters& parameters) const {

    const double irregularity = parameters.irregularity();
    if (irregularity >= GenerationParameters::min_irregularity &&
        irregularity <= GenerationParameters::max_irregularity) {
        return std::nullopt;
    }

    ParameterViolation violation;
    violation.field = "irregularity";
    violation.bound = format_range(GenerationParameters::min_irregularity,
                                   GenerationParameters::max_irregularity);
    violation.value = format_number(irregularity);
    violation.suggestion = "Irregularity must be between 0.0 and 1.0";
    return violation;
}

} // namespace debris
