/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory parameters
 *
 * Validates command-line inputs for contradictions and provides clear
 * error messages with suggested solutions when conflicts are detected.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "CommandLineConfig.hpp"
#include <string>
#include <vector>
#include <optional>

namespace pgexport {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Validates user inputs for contradictions and conflicts
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Check every pair of mutually exclusive parameters
     * @param config Parsed command line
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const CommandLineConfig& config) const;

private:
    std::optional<ParameterConflict> check_verbosity_flags(const CommandLineConfig& config) const;

    std::optional<ParameterConflict> check_query_source(const CommandLineConfig& config) const;

    /**
     * @brief Full-mode and streaming-mode template flags are exclusive
     */
    std::optional<ParameterConflict> check_template_mode(const CommandLineConfig& config) const;

    /**
     * @brief COPY is a csv-only fast path
     */
    std::optional<ParameterConflict> check_copy_format(const CommandLineConfig& config) const;
};

} // namespace pgexport
