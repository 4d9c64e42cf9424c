/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "HexGridTessellator.hpp"
#include <sstream>
#include <algorithm>
#include <cmath>

namespace hexmosaic {

namespace {

std::string format_value(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

void add_conflict(ValidationResult& result, std::optional<ParameterConflict> conflict) {
    if (conflict) {
        result.conflicts.push_back(std::move(*conflict));
        result.is_valid = false;
    }
}

} // namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Contradictory parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nProgram terminated due to contradictory inputs.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const HexMosaicConfig& config) const {
    ValidationResult result;
    add_conflict(result, check_positive_sizes(config));
    add_conflict(result, check_area_threshold(config));
    add_conflict(result, check_offsets_alignment(config));
    return result;
}

ValidationResult InputValidator::validate_tessellation(const HexMosaicConfig& config,
                                                       double aoi_width_m, double aoi_height_m) const {
    ValidationResult result;
    add_conflict(result, check_positive_sizes(config));
    if (result.is_valid) {
        add_conflict(result, check_hex_count(config, aoi_width_m, aoi_height_m));
    }
    return result;
}

std::optional<ParameterConflict> InputValidator::check_positive_sizes(const HexMosaicConfig& config) const {
    std::vector<std::string> params;
    if (!(config.hex_size_m > 0.0)) {
        params.push_back("--hex-size " + format_value(config.hex_size_m));
    }
    if (!(config.bucket_size > 0.0)) {
        params.push_back("--bucket-size " + format_value(config.bucket_size));
    }
    if (config.line_step_m < 0.0) {
        params.push_back("--line-step " + format_value(config.line_step_m));
    }
    if (config.line_buffer_m < 0.0) {
        params.push_back("--line-buffer " + format_value(config.line_buffer_m));
    }
    if (params.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Sizes must be positive";
    conflict.involved_params = params;
    conflict.suggestions = {
        "Use --hex-size 500m and --bucket-size 10 (the defaults)",
        "Use --line-step 0 to sample lines at 0.3 x the hex spacing"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_area_threshold(const HexMosaicConfig& config) const {
    if (config.area_threshold >= 0.0 && config.area_threshold <= 1.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Area threshold is a fraction of the hex area";
    conflict.involved_params = {"--area-threshold " + format_value(config.area_threshold)};
    conflict.suggestions = {
        "Use a value between 0 and 1, e.g. --area-threshold 0.25",
        "Use --area-threshold 0 to keep every overlapping hex"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_offsets_alignment(const HexMosaicConfig& config) const {
    if (config.default_alignment != TileAlignment::EXTENT ||
        (config.offset_ns == 0.0 && config.offset_ew == 0.0)) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Tile offsets are ignored by extent alignment";
    conflict.involved_params = {
        "--alignment extent",
        "--offset-ns " + format_value(config.offset_ns) + ", --offset-ew " + format_value(config.offset_ew)
    };
    conflict.suggestions = {
        "Use --alignment minute or --alignment degree",
        "Drop --offset-ns and --offset-ew"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_hex_count(const HexMosaicConfig& config,
                                                                 double aoi_width_m, double aoi_height_m) const {
    if (config.experimental) {
        return std::nullopt;
    }
    const HexCountEstimate estimate = estimate_hex_count(aoi_width_m, aoi_height_m, config.hex_size_m);
    if (!estimate.exceeds(config.max_hexes_without_experimental)) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "AOI is more hexes across than allowed without --experimental";

    std::ostringstream calc;
    calc << "Estimate: " << estimate.width_hex << " x " << estimate.height_hex
         << " hexes, limit " << config.max_hexes_without_experimental << " per side";
    conflict.involved_params = {
        "--hex-size " + format_value(config.hex_size_m) + "m",
        "AOI " + format_value(aoi_width_m) + "m x " + format_value(aoi_height_m) + "m",
        calc.str()
    };

    const double longest_side = std::max(aoi_width_m, aoi_height_m);
    const double suggested_size = std::ceil(longest_side / config.max_hexes_without_experimental);
    conflict.suggestions = {
        "Use --hex-size " + format_value(suggested_size) + "m or larger",
        "Use --experimental to allow large grids"
    };
    return conflict;
}

} // namespace hexmosaic
