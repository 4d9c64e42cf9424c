/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for HexMosaic projects
 */

#include "ConfigurationManager.hpp"
#include "UnitParser.hpp"
#include "../core/ElevationSampler.hpp"
#include "../core/Errors.hpp"
#include "../core/LineTracer.hpp"
#include "../core/SegmentationEngine.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace hexmosaic {

using json = nlohmann::json;

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Numbers and booleans are written back with their JSON types
json typed_value(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    if (!value.empty()) {
        try {
            size_t consumed = 0;
            const double number = std::stod(value, &consumed);
            if (consumed == value.size()) {
                if (value.find_first_of(".eE") == std::string::npos) {
                    return static_cast<std::int64_t>(number);
                }
                return number;
            }
        } catch (const std::exception&) {
            // Not a number; kept as a string
        }
    }
    return value;
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        last_error_ = "Cannot open config file: " + filename;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_string(buffer.str())) {
        last_error_ = filename + ": " + last_error_;
        return false;
    }
    return true;
}

bool ConfigurationManager::load_from_string(const std::string& text) {
    json config;
    try {
        config = json::parse(text);
    } catch (const json::exception& e) {
        last_error_ = std::string("Error parsing JSON config: ") + e.what();
        return false;
    }

    if (!config.is_object()) {
        last_error_ = "Config must be a JSON object";
        return false;
    }
    if (!config.contains("schema_version")) {
        last_error_ = "Config has no schema_version; expected " +
                      std::to_string(HexMosaicConfig::kSchemaVersion);
        return false;
    }
    const json& version = config["schema_version"];
    if (!version.is_number_integer() || version.get<int>() != HexMosaicConfig::kSchemaVersion) {
        last_error_ = "Unsupported config schema_version " + version.dump() + "; expected " +
                      std::to_string(HexMosaicConfig::kSchemaVersion);
        return false;
    }

    std::map<std::string, std::string> values;
    for (const auto& [key, value] : config.items()) {
        if (key == "schema_version" || value.is_null()) {
            continue;
        }
        if (value.is_string()) {
            values[key] = value.get<std::string>();
        } else if (value.is_boolean()) {
            values[key] = value.get<bool>() ? "true" : "false";
        } else if (value.is_number()) {
            values[key] = value.dump();
        } else {
            last_error_ = "Config value '" + key + "' must be a string, number or boolean";
            return false;
        }
    }

    for (auto& [key, value] : values) {
        config_values_[key] = value;
    }
    last_error_.clear();
    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    json config;
    config["schema_version"] = HexMosaicConfig::kSchemaVersion;
    for (const auto& [key, value] : config_values_) {
        config[key] = typed_value(value);
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << config.dump(2) << std::endl;
    return file.good();
}

int ConfigurationManager::get_int(const std::string& key, int default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    size_t consumed = 0;
    const int value = std::stoi(it->second, &consumed);
    if (consumed != it->second.size()) {
        throw std::invalid_argument("Config value '" + key + "' is not an integer: " + it->second);
    }
    return value;
}

double ConfigurationManager::get_double(const std::string& key, double default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    size_t consumed = 0;
    const double value = std::stod(it->second, &consumed);
    if (consumed != it->second.size()) {
        throw std::invalid_argument("Config value '" + key + "' is not a number: " + it->second);
    }
    return value;
}

HexMosaicConfig ConfigurationManager::to_config() const {
    HexMosaicConfig config;
    UnitParser parser(DistanceUnit::METERS);

    auto distance = [&](const std::string& key, double fallback) {
        return has_value(key) ? parser.parse_distance(get_string(key)).value : fallback;
    };

    config.project_directory = get_string("project_directory", config.project_directory);

    config.hex_size_m = distance("hex_size_m", config.hex_size_m);
    config.max_hexes_without_experimental =
        get_int("max_hexes_without_experimental", config.max_hexes_without_experimental);
    config.experimental = get_bool("experimental", config.experimental);

    if (has_value("sampling_method")) {
        config.sampling_method = parse_sampling_method(get_string("sampling_method"));
    }
    config.bucket_size = get_double("bucket_size", config.bucket_size);

    if (has_value("default_scale")) {
        config.default_scale = find_scale_preset(get_string("default_scale")).key;
    }
    if (has_value("default_alignment")) {
        config.default_alignment = parse_tile_alignment(get_string("default_alignment"));
    }

    std::optional<OffsetUnit> offset_unit;
    for (const char* key : {"offset_ns", "offset_ew"}) {
        if (!has_value(key)) {
            continue;
        }
        const ParsedOffset offset = parser.parse_offset(get_string(key));
        if (offset_unit && *offset_unit != offset.unit) {
            throw InvalidArgument("offset_ns and offset_ew must use the same unit");
        }
        offset_unit = offset.unit;
        (std::string(key) == "offset_ns" ? config.offset_ns : config.offset_ew) = offset.value;
    }
    if (offset_unit) {
        config.offset_unit = *offset_unit;
    }

    config.area_threshold = get_double("area_threshold", config.area_threshold);
    config.line_buffer_m = distance("line_buffer_m", config.line_buffer_m);
    config.line_step_m = distance("line_step_m", config.line_step_m);
    if (has_value("line_behavior")) {
        config.line_behavior = parse_line_behavior(get_string("line_behavior"));
    }

    config.log_level = get_string("log_level", config.log_level);
    if (has_value("log_file")) {
        config.log_file = get_string("log_file");
    }
    return config;
}

void ConfigurationManager::from_config(const HexMosaicConfig& config) {
    set_value("project_directory", config.project_directory);
    set_value("hex_size_m", format_number(config.hex_size_m));
    set_value("max_hexes_without_experimental", std::to_string(config.max_hexes_without_experimental));
    set_value("experimental", config.experimental ? "true" : "false");

    set_value("sampling_method", to_string(config.sampling_method));
    set_value("bucket_size", format_number(config.bucket_size));

    set_value("default_scale", config.default_scale);
    set_value("default_alignment", to_string(config.default_alignment));
    const std::string offset_suffix = config.offset_unit == OffsetUnit::ARC_MINUTES ? "arcmin" : "km";
    set_value("offset_ns", format_number(config.offset_ns) + offset_suffix);
    set_value("offset_ew", format_number(config.offset_ew) + offset_suffix);

    set_value("area_threshold", format_number(config.area_threshold));
    set_value("line_buffer_m", format_number(config.line_buffer_m));
    set_value("line_step_m", format_number(config.line_step_m));
    set_value("line_behavior", to_string(config.line_behavior));

    set_value("log_level", config.log_level);
    if (config.log_file) {
        set_value("log_file", *config.log_file);
    }
}

} // namespace hexmosaic
