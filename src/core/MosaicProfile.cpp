/**
 * @file MosaicProfile.cpp
 * @brief Profile parsing and default source selection
 */

#include "MosaicProfile.hpp"
#include "Errors.hpp"
#include "LineTracer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace hexmosaic {

using json = nlohmann::json;

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_set(const json& entry, const char* key) {
    if (!entry.contains(key)) return false;
    const json& value = entry[key];
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) return !value.get<std::string>().empty();
    return true;
}

bool matches_hint(const std::string& layer, const std::vector<std::string>& hints) {
    const std::string name = lower(layer);
    for (const auto& hint : hints) {
        if (name.find(lower(hint)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

MosaicProfile MosaicProfile::from_json(const json& document) {
    MosaicProfile profile;
    if (!document.is_object() || !document.contains("classes")) {
        return profile;
    }
    const json& entries = document["classes"];
    if (!entries.is_array()) {
        throw InvalidArgument("Mosaic profile 'classes' must be an array.");
    }

    for (const auto& entry : entries) {
        if (!entry.is_object()) continue;
        const std::string id = entry.value("id", std::string());
        const std::string target = entry.value("target_layer", std::string());
        if (id.empty() || target.empty()) {
            continue;
        }

        MosaicClass cls;
        cls.class_id = id;
        cls.target_layer = target;
        cls.priority = entry.value("priority", 0);
        if (entry.contains("match")) {
            cls.matchers = entry["match"];
        }
        if (is_set(entry, "fill")) {
            cls.mode = MosaicMode::POLYGON;
        } else if (is_set(entry, "line")) {
            cls.mode = MosaicMode::LINE;
        }
        if (entry.contains("line") && entry["line"].is_string()) {
            cls.line_behavior = parse_line_behavior(entry["line"].get<std::string>());
        }
        profile.classes_.push_back(std::move(cls));
    }

    std::stable_sort(profile.classes_.begin(), profile.classes_.end(),
                     [](const MosaicClass& a, const MosaicClass& b) { return a.priority < b.priority; });
    return profile;
}

bool MosaicProfile::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        last_error_ = "Could not open mosaic profile: " + filename;
        return false;
    }
    try {
        json document;
        file >> document;
        *this = from_json(document);
        return true;
    } catch (const json::exception& e) {
        last_error_ = std::string("Failed to parse mosaic profile: ") + e.what();
    } catch (const InvalidArgument& e) {
        last_error_ = e.what();
    }
    return false;
}

const MosaicClass* MosaicProfile::find(const std::string& class_id) const {
    for (const auto& cls : classes_) {
        if (cls.class_id == class_id) {
            return &cls;
        }
    }
    return nullptr;
}

MosaicClassState MosaicProfile::default_state(const MosaicClass& cls,
                                              const std::vector<std::string>& available_layers) const {
    MosaicClassState state;
    const auto& hints = default_source_hints();
    auto it = hints.find(cls.class_id);
    if (it == hints.end()) {
        return state;
    }
    for (const auto& layer : available_layers) {
        if (cls.mode == MosaicMode::POLYGON && matches_hint(layer, it->second.polygons)) {
            state.polygon_sources.insert(layer);
        }
        if (cls.mode == MosaicMode::LINE && matches_hint(layer, it->second.lines)) {
            state.line_sources.insert(layer);
        }
    }
    return state;
}

const std::map<std::string, SourceHints>& MosaicProfile::default_source_hints() {
    static const std::map<std::string, SourceHints> hints = {
        {"forest", {{"landcover_forest", "Landcover - Forest"}, {}}},
        {"wetland", {{"landcover_wetland", "Landcover - Wetlands", "water_polygons", "Water - Polygons"}, {}}},
        {"fields", {{"landcover_fields", "Landcover - Fields"}, {}}},
        {"vineyards", {{"landcover_fields", "Landcover - Fields"}, {}}},
        {"builtup_commercial_industry", {{"landcover_industrial", "Landcover - Industrial"}, {}}},
        {"builtup_town", {{"buildings", "Buildings"}, {}}},
        {"builtup_highrise", {{"buildings", "Buildings"}, {}}},
        {"water_lake", {{"water_polygons", "Water - Polygons"}, {}}},
        {"water_river", {{"water_riverbank", "Water - Riverbanks"}, {}}},
        {"water_stream_major", {{}, {"water_major", "Water - Major Rivers"}}},
        {"water_stream_minor", {{}, {"water_minor", "Water - Streams"}}},
        {"road_highway", {{}, {"roads_highways", "Roads - Highways"}}},
        {"road_primary", {{}, {"roads_primary", "Roads - Primary"}}},
        {"road_secondary", {{}, {"roads_minor", "Roads - Minor", "roads_tracks", "Roads - Tracks & Paths"}}},
        {"rail", {{}, {"rail_lines", "Rail"}}},
        {"airstrip", {{}, {"airstrips", "Aeroways"}}},
    };
    return hints;
}

} // namespace hexmosaic
