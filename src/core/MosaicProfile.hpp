#pragma once

/**
 * @file MosaicProfile.hpp
 * @brief Mosaic palette classes loaded from a JSON profile
 */

#include "hexmosaic.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hexmosaic {

enum class MosaicMode {
    POLYGON,
    LINE
};

/**
 * @brief One palette class of the profile
 */
struct MosaicClass {
    std::string class_id;
    std::string target_layer;
    MosaicMode mode = MosaicMode::POLYGON;
    int priority = 0;
    nlohmann::json matchers = nlohmann::json::array();
    LineBehavior line_behavior = LineBehavior::CENTROID_PATH;
};

/**
 * @brief User selections and parameters for one class
 *
 * Sources are layer names or paths, resolved by the caller.
 */
struct MosaicClassState {
    static constexpr double kDefaultAreaThreshold = 0.0;
    static constexpr double kDefaultLineBuffer = 30.0;
    static constexpr double kDefaultLineStep = 200.0;

    std::set<std::string> polygon_sources;
    std::set<std::string> line_sources;
    double area_threshold = kDefaultAreaThreshold;
    double line_buffer = kDefaultLineBuffer;
    double line_step = kDefaultLineStep;
};

/**
 * @brief Layer-name fragments that select default sources for a class
 */
struct SourceHints {
    std::vector<std::string> polygons;
    std::vector<std::string> lines;
};

/**
 * @brief Ordered set of mosaic classes
 *
 * Profile format:
 * @code
 * {"classes": [{"id": "forest", "target_layer": "Forest", "priority": 10,
 *               "match": [...], "fill": "#2e7d32"},
 *              {"id": "road_primary", "target_layer": "Roads", "line": "edge_path"}]}
 * @endcode
 *
 * A class with "fill" is a polygon class, one with only "line" is a line
 * class. Entries without an id or target layer are ignored.
 */
class MosaicProfile {
public:
    MosaicProfile() = default;

    /**
     * @brief Build from a parsed profile document
     * @throws InvalidArgument when "classes" is present but not an array,
     *         or a line behavior is unknown
     */
    static MosaicProfile from_json(const nlohmann::json& document);

    /**
     * @brief Load a profile file
     * @return true if the file was read and parsed
     */
    bool load_from_file(const std::string& filename);

    const std::vector<MosaicClass>& classes() const { return classes_; }
    const MosaicClass* find(const std::string& class_id) const;
    const std::string& last_error() const { return last_error_; }

    /**
     * @brief Default state for a class with sources chosen by name hints
     *
     * A layer matches a hint when its name contains the hint,
     * case-insensitively.
     */
    MosaicClassState default_state(const MosaicClass& cls,
                                   const std::vector<std::string>& available_layers) const;

    /// Built-in source hints keyed by class id
    static const std::map<std::string, SourceHints>& default_source_hints();

private:
    std::vector<MosaicClass> classes_;
    std::string last_error_;
};

} // namespace hexmosaic
