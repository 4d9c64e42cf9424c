/**
 * @file ConfigurationManager.hpp
 * @brief Project configuration file management
 */

#pragma once

#include "hexmosaic.hpp"
#include <string>
#include <map>
#include <optional>

namespace hexmosaic {

/**
 * @brief Loads and saves hexmosaic.config.json
 *
 * Values are held as strings keyed by their JSON name so that distances
 * may carry units ("2km") until they are converted.
 */
class ConfigurationManager {
public:
    static constexpr const char* kDefaultFileName = "hexmosaic.config.json";

    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     *
     * The document must be a JSON object with "schema_version" equal to
     * HexMosaicConfig::kSchemaVersion.
     *
     * @param filename Path to configuration file
     * @return true if successful, false otherwise (see last_error())
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Load configuration from JSON text
     */
    bool load_from_string(const std::string& text);

    /**
     * @brief Save configuration to file with the current schema_version
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Convert to HexMosaicConfig, starting from the defaults
     * @throws UnitParseError for a distance that cannot be parsed
     * @throws InvalidArgument for an unknown sampling method, alignment or
     *         line behavior
     */
    HexMosaicConfig to_config() const;

    /**
     * @brief Load every value from a HexMosaicConfig
     */
    void from_config(const HexMosaicConfig& config);

    // Value setters and getters
    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    /// @throws std::invalid_argument when the stored value is not an integer
    int get_int(const std::string& key, int default_value = 0) const;

    /// @throws std::invalid_argument when the stored value is not a number
    double get_double(const std::string& key, double default_value = 0.0) const;

    bool get_bool(const std::string& key, bool default_value = false) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            const std::string& value = it->second;
            return value == "true" || value == "1" || value == "yes";
        }
        return default_value;
    }

    const std::map<std::string, std::string>& values() const { return config_values_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::map<std::string, std::string> config_values_;
    std::string last_error_;
};

} // namespace hexmosaic
