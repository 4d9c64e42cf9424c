/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory parameters
 *
 * Validates user inputs for contradictions and provides clear error messages
 * with suggested solutions when conflicts are detected.
 */

#pragma once

#include "hexmosaic.hpp"
#include <string>
#include <vector>
#include <optional>

namespace hexmosaic {

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
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const HexMosaicConfig& config) const;

    /**
     * @brief Validate a planned tessellation of an AOI of the given size
     */
    ValidationResult validate_tessellation(const HexMosaicConfig& config,
                                           double aoi_width_m, double aoi_height_m) const;

private:
    std::optional<ParameterConflict> check_positive_sizes(const HexMosaicConfig& config) const;

    /**
     * @brief Coverage threshold is a fraction of the hex area
     */
    std::optional<ParameterConflict> check_area_threshold(const HexMosaicConfig& config) const;

    /**
     * @brief Offsets shift geographic lattices only
     */
    std::optional<ParameterConflict> check_offsets_alignment(const HexMosaicConfig& config) const;

    std::optional<ParameterConflict> check_hex_count(const HexMosaicConfig& config,
                                                     double aoi_width_m, double aoi_height_m) const;
};

} // namespace hexmosaic
