#include "UnitParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace hexmosaic {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimmed(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    return text.substr(first, text.find_last_not_of(" \t\n\r") - first + 1);
}

} // namespace

// ============================================================================
// UNIT CONVERSION
// ============================================================================

double UnitParser::to_meters_factor(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:      return 1.0;
        case DistanceUnit::KILOMETERS:  return 1000.0;
        case DistanceUnit::FEET:        return 0.3048;
        case DistanceUnit::MILES:       return 1609.34;
    }
    throw UnitParseError("Unknown distance unit in to_meters_factor");
}

double UnitParser::convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit) {
    if (from_unit == to_unit) {
        return value;
    }
    return value * to_meters_factor(from_unit) / to_meters_factor(to_unit);
}

DistanceUnit UnitParser::parse_unit_string(const std::string& unit_str) {
    const std::string lower_unit = to_lower(unit_str);

    if (lower_unit == "m" || lower_unit == "meters" || lower_unit == "metres") {
        return DistanceUnit::METERS;
    } else if (lower_unit == "km" || lower_unit == "kilometers" || lower_unit == "kilometres") {
        return DistanceUnit::KILOMETERS;
    } else if (lower_unit == "ft" || lower_unit == "feet") {
        return DistanceUnit::FEET;
    } else if (lower_unit == "mi" || lower_unit == "miles") {
        return DistanceUnit::MILES;
    }

    throw UnitParseError("Unrecognized unit: '" + unit_str + "'. Supported units: m, km, ft, mi");
}

std::string UnitParser::unit_to_string(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:      return "m";
        case DistanceUnit::KILOMETERS:  return "km";
        case DistanceUnit::FEET:        return "ft";
        case DistanceUnit::MILES:       return "mi";
    }
    return "unknown";
}

// ============================================================================
// VALUE AND UNIT SPLITTING
// ============================================================================

std::pair<std::string, std::string> UnitParser::split_value_and_unit(const std::string& input) const {
    const std::string text = trimmed(input);
    if (text.empty()) {
        throw UnitParseError("Empty input string");
    }

    size_t num_end = 0;
    bool found_decimal = false;
    bool found_digit = false;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            found_digit = true;
            num_end = i + 1;
        } else if (c == '.' && !found_decimal) {
            found_decimal = true;
            num_end = i + 1;
        } else if ((c == '-' || c == '+') && i == 0) {
            num_end = i + 1;
        } else {
            break;
        }
    }

    if (!found_digit) {
        throw UnitParseError("No numeric value found in: '" + input + "'");
    }

    return {text.substr(0, num_end), trimmed(text.substr(num_end))};
}

double UnitParser::parse_number(const std::string& text) const {
    try {
        return std::stod(text);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid numeric value: '" + text + "'");
    }
}

// ============================================================================
// DISTANCE PARSING
// ============================================================================

ParsedValue UnitParser::parse_distance(const std::string& input) const {
    auto [value_str, unit_str] = split_value_and_unit(input);
    const double value = parse_number(value_str);

    DistanceUnit source_unit = default_unit_;
    const bool had_explicit_unit = !unit_str.empty();
    if (had_explicit_unit) {
        source_unit = parse_unit_string(unit_str);
    }

    return ParsedValue(convert_distance(value, source_unit, DistanceUnit::METERS), source_unit, had_explicit_unit);
}

ParsedOffset UnitParser::parse_offset(const std::string& input) const {
    auto [value_str, unit_str] = split_value_and_unit(input);
    const double value = parse_number(value_str);
    const std::string unit = to_lower(unit_str);

    if (unit == "'" || unit == "arcmin" || unit == "min") {
        return {value, OffsetUnit::ARC_MINUTES};
    }
    if (unit.empty() || unit == "km") {
        return {value, OffsetUnit::KILOMETERS};
    }
    const double meters = convert_distance(value, parse_unit_string(unit), DistanceUnit::METERS);
    return {meters / 1000.0, OffsetUnit::KILOMETERS};
}

// ============================================================================
// DMS COORDINATE PARSING
// ============================================================================

bool UnitParser::is_dms_format(const std::string& input) const {
    return input.find("°") != std::string::npos ||
           input.find_first_of("d'\"NSEWnsew") != std::string::npos;
}

double UnitParser::parse_dms(const std::string& input, bool is_latitude) const {
    std::string work = trimmed(input);

    // Hemisphere letter at the end
    char hemisphere = '\0';
    if (!work.empty()) {
        const char last_char = static_cast<char>(std::toupper(static_cast<unsigned char>(work.back())));
        if (last_char == 'N' || last_char == 'S' || last_char == 'E' || last_char == 'W') {
            hemisphere = last_char;
            work.pop_back();
        }
    }

    // The degree sign is multi-byte UTF-8
    size_t pos = 0;
    const std::string degree = "°";
    while ((pos = work.find(degree, pos)) != std::string::npos) {
        work.replace(pos, degree.size(), " ");
        pos += 1;
    }
    for (char& c : work) {
        if (c == 'd' || c == '\'' || c == '"' || c == 'm' || c == 's') {
            c = ' ';
        }
    }

    std::istringstream iss(work);
    double degrees = 0.0, minutes = 0.0, seconds = 0.0;

    iss >> degrees;
    if (iss.fail()) {
        throw UnitParseError("Invalid DMS format: '" + input + "'");
    }
    if (iss >> minutes) {
        iss >> seconds;
    }

    if (minutes < 0 || minutes >= 60) {
        throw UnitParseError("Invalid minutes value: " + std::to_string(minutes));
    }
    if (seconds < 0 || seconds >= 60) {
        throw UnitParseError("Invalid seconds value: " + std::to_string(seconds));
    }

    double decimal = std::abs(degrees) + minutes / 60.0 + seconds / 3600.0;

    bool is_negative = std::signbit(degrees);
    if (hemisphere == 'S' || hemisphere == 'W') {
        is_negative = true;
    } else if (hemisphere == 'N' || hemisphere == 'E') {
        is_negative = false;
    }
    if (is_negative) {
        decimal = -decimal;
    }

    const double limit = is_latitude ? 90.0 : 180.0;
    if (decimal < -limit || decimal > limit) {
        throw UnitParseError(std::string(is_latitude ? "Latitude" : "Longitude") + " out of range: " +
                             std::to_string(decimal));
    }
    return decimal;
}

// ============================================================================
// COORDINATE PARSING
// ============================================================================

double UnitParser::parse_latitude(const std::string& input) const {
    if (is_dms_format(input)) {
        return parse_dms(input, true);
    }
    const double lat = parse_number(trimmed(input));
    if (lat < -90.0 || lat > 90.0) {
        throw UnitParseError("Latitude out of range [-90, 90]: " + std::to_string(lat));
    }
    return lat;
}

double UnitParser::parse_longitude(const std::string& input) const {
    if (is_dms_format(input)) {
        return parse_dms(input, false);
    }
    const double lon = parse_number(trimmed(input));
    if (lon < -180.0 || lon > 180.0) {
        throw UnitParseError("Longitude out of range [-180, 180]: " + std::to_string(lon));
    }
    return lon;
}

std::pair<double, double> UnitParser::parse_coordinate_pair(const std::string& input) const {
    const size_t comma_pos = input.find(',');
    if (comma_pos == std::string::npos) {
        throw UnitParseError("Coordinate pair must be separated by comma: '" + input + "'");
    }
    return {parse_latitude(input.substr(0, comma_pos)), parse_longitude(input.substr(comma_pos + 1))};
}

Point2D UnitParser::parse_point(const std::string& input) const {
    const size_t comma_pos = input.find(',');
    if (comma_pos == std::string::npos) {
        throw UnitParseError("Point must be given as x,y: '" + input + "'");
    }
    return Point2D(parse_number(trimmed(input.substr(0, comma_pos))),
                   parse_number(trimmed(input.substr(comma_pos + 1))));
}

} // namespace hexmosaic
