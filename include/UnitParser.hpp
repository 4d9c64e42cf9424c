#pragma once

#include "hexmosaic.hpp"
#include <string>
#include <stdexcept>
#include <utility>

namespace hexmosaic {

/**
 * @brief Exception thrown when unit parsing fails
 */
class UnitParseError : public std::runtime_error {
public:
    explicit UnitParseError(const std::string& message)
        : std::runtime_error("Unit parsing error: " + message) {}
};

/**
 * @brief Ground distance units accepted on the command line and in config files
 */
enum class DistanceUnit {
    METERS,      // m
    KILOMETERS,  // km
    FEET,        // ft
    MILES        // mi
};

/**
 * @brief Result of parsing a value with units
 */
struct ParsedValue {
    double value;              // Numeric value in meters
    DistanceUnit original_unit; // Unit that was parsed
    bool had_explicit_unit;    // Whether unit was explicitly specified

    ParsedValue(double v, DistanceUnit u, bool explicit_unit = false)
        : value(v), original_unit(u), had_explicit_unit(explicit_unit) {}
};

/**
 * @brief Map-tile offset with its unit
 */
struct ParsedOffset {
    double value;
    OffsetUnit unit;
};

/**
 * @brief Parses distances, tile offsets and coordinates
 *
 * - Distance: "500", "500m", "2km", "1mi", "1500ft"
 * - Offset: "2km", "2000m", "7.5'", "7.5arcmin"
 * - Coordinates: "45.5231" (decimal degrees) or "45°31'23"N" (DMS)
 *
 * Examples:
 *   hexmosaic tessellate --hex-size 1km
 *   hexmosaic segment --offset-ns 7.5arcmin
 *   hexmosaic create-aoi --center 63°07'29"N,151°11'05"W
 */
class UnitParser {
public:
    UnitParser() = default;

    /**
     * @brief Construct parser with a default unit for bare numbers
     */
    explicit UnitParser(DistanceUnit default_unit) : default_unit_(default_unit) {}

    void set_default_unit(DistanceUnit unit) { default_unit_ = unit; }
    DistanceUnit default_unit() const { return default_unit_; }

    // ========================================================================
    // DISTANCE PARSING
    // ========================================================================

    /**
     * @brief Parse a distance with optional unit suffix into meters
     *
     * Examples:
     *   parse_distance("200") -> 200.0
     *   parse_distance("5km") -> 5000.0
     *   parse_distance("10mi") -> 16093.4
     */
    ParsedValue parse_distance(const std::string& input) const;

    /**
     * @brief Parse a map-tile offset
     *
     * Bare numbers and metric suffixes give kilometers; "'", "arcmin" and
     * "min" give arc-minutes.
     */
    ParsedOffset parse_offset(const std::string& input) const;

    // ========================================================================
    // COORDINATE PARSING
    // ========================================================================

    /**
     * @brief Parse a latitude coordinate (decimal or DMS)
     *
     * @param input String to parse
     * @return Latitude in decimal degrees (-90 to +90)
     *
     * Decimal examples:
     *   "63.1497" -> 63.1497
     *
     * DMS examples:
     *   "63°07'29"N" -> 63.124722
     *   "63d07m29sN" -> 63.124722
     */
    double parse_latitude(const std::string& input) const;

    /**
     * @brief Parse a longitude coordinate (decimal or DMS)
     *
     * @param input String to parse
     * @return Longitude in decimal degrees (-180 to +180)
     */
    double parse_longitude(const std::string& input) const;

    /**
     * @brief Parse a coordinate pair (lat,lon)
     *
     * @return Pair of (latitude, longitude) in decimal degrees
     */
    std::pair<double, double> parse_coordinate_pair(const std::string& input) const;

    /**
     * @brief Parse a projected point "x,y" in CRS units
     */
    Point2D parse_point(const std::string& input) const;

    // ========================================================================
    // UNIT CONVERSION
    // ========================================================================

    static double convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit);

    static double to_meters_factor(DistanceUnit unit);

    /**
     * @brief Parse unit string to DistanceUnit enum
     * @throws UnitParseError if unit string is not recognized
     */
    static DistanceUnit parse_unit_string(const std::string& unit_str);

    static std::string unit_to_string(DistanceUnit unit);

private:
    DistanceUnit default_unit_ = DistanceUnit::METERS;

    /**
     * @brief Split numeric value and unit suffix
     *
     * Examples:
     *   "200" -> ("200", "")
     *   "5km" -> ("5", "km")
     *   "7.5'" -> ("7.5", "'")
     */
    std::pair<std::string, std::string> split_value_and_unit(const std::string& input) const;

    double parse_number(const std::string& text) const;

    /**
     * @brief Parse DMS (degrees/minutes/seconds) format
     *
     * Supported formats:
     *   - 63°07'29"N (Unicode degree symbol)
     *   - 63d07m29sN (ASCII letters)
     *   - 63 07 29 N (space-separated)
     */
    double parse_dms(const std::string& input, bool is_latitude) const;

    bool is_dms_format(const std::string& input) const;
};

} // namespace hexmosaic
