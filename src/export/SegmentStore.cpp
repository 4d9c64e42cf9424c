/**
 * @file SegmentStore.cpp
 * @brief Implementation of segment persistence
 */

#include "SegmentStore.hpp"
#include "../core/FeatureSource.hpp"
#include "../core/SegmentationEngine.hpp"
#include <filesystem>
#include <fstream>

namespace hexmosaic {

using json = nlohmann::json;

namespace {

json point_json(const std::optional<Point2D>& point, const char* x_key, const char* y_key) {
    if (!point) {
        return nullptr;
    }
    return json{{x_key, point->x()}, {y_key, point->y()}};
}

} // namespace

SegmentStore::SegmentStore(ProjectPaths paths)
    : paths_(std::move(paths)), logger_("SegmentStore") {}

json SegmentStore::to_metadata(const SegmentationResult& result, const std::vector<std::string>& segment_names) {
    json entry = {
        {"parent", result.parent},
        {"rows", result.rows},
        {"cols", result.cols},
        {"segments", segment_names},
        {"mode", to_string(result.mode)},
        {"alignment", result.alignment},
        {"tile_width_km", result.tile_width_km},
        {"tile_height_km", result.tile_height_km},
        {"origin", {
            {"project", point_json(result.origin.project, "x", "y")},
            {"geographic", point_json(result.origin.geographic, "lon", "lat")},
        }},
    };

    if (result.mode == SegmentMode::MAP_TILE) {
        entry["scale"] = result.scale_key;
        entry["scale_label"] = result.scale_label;
        entry["subdir"] = result.subdir;
        entry["offsets"] = {
            {"ns", result.offsets.ns},
            {"ew", result.offsets.ew},
            {"unit", to_string(result.offsets.unit)},
        };
        if (result.grid) {
            entry["grid"] = {
                {"tile_lon_deg", result.grid->tile_lon_deg},
                {"tile_lat_deg", result.grid->tile_lat_deg},
                {"meters_per_deg_lon", result.grid->meters_per_deg_lon},
                {"meters_per_deg_lat", result.grid->meters_per_deg_lat},
            };
        } else {
            entry["grid"] = nullptr;
        }
    }
    return entry;
}

json SegmentStore::load_settings() const {
    const auto file_path = paths_.project_settings_file();
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return json::object();
    }
    try {
        json settings;
        file >> settings;
        if (settings.is_object()) {
            return settings;
        }
        logger_.warning("Project settings in " + file_path.string() + " are not an object; starting fresh");
    } catch (const json::exception& e) {
        logger_.warning("Could not parse " + file_path.string() + ": " + e.what());
    }
    return json::object();
}

bool SegmentStore::save_settings(const json& settings) {
    const auto file_path = paths_.project_settings_file();
    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    std::ofstream file(file_path);
    if (!file.is_open()) {
        last_error_ = "Could not write project settings: " + file_path.string();
        logger_.error(last_error_);
        return false;
    }
    file << settings.dump(2) << std::endl;
    return true;
}

bool SegmentStore::write(const std::string& aoi_name, const SegmentationResult& result) {
    last_error_.clear();
    if (!result.ok || result.cells.empty()) {
        last_error_ = result.message.empty() ? "No segments to save." : result.message;
        logger_.warning(last_error_);
        return false;
    }

    const auto base_dir = paths_.segments_dir(aoi_name);
    std::error_code ec;
    std::filesystem::remove_all(base_dir, ec);
    if (ec) {
        logger_.warning("Could not remove " + base_dir.string() + ": " + ec.message());
    }
    const auto segment_dir = result.subdir.empty() ? base_dir : base_dir / result.subdir;

    const bool map_tile = result.mode == SegmentMode::MAP_TILE;
    std::vector<std::string> names;
    for (const auto& cell : result.cells) {
        const std::string name = segment_name(result, cell);

        MemoryFeatureSource layer(name, result.crs, GeometryKind::POLYGON);
        layer.add_field(FieldDefinition("id", FieldType::INTEGER, 10));
        layer.add_field(FieldDefinition("row", FieldType::INTEGER, 10));
        layer.add_field(FieldDefinition("col", FieldType::INTEGER, 10));
        layer.add_field(FieldDefinition("name", FieldType::STRING, 80));
        layer.add_field(FieldDefinition("scale", FieldType::STRING, 32));
        layer.add_field(FieldDefinition("align", FieldType::STRING, 16));
        layer.add_feature(cell.geometry, {
            FieldValue(cell.id),
            FieldValue(static_cast<std::int64_t>(cell.row)),
            FieldValue(static_cast<std::int64_t>(cell.col)),
            FieldValue(name),
            FieldValue(map_tile ? result.scale_key : std::string()),
            FieldValue(map_tile ? result.alignment : std::string("equal")),
        });

        const auto file_path = segment_dir / segment_file_name(result, cell);
        if (!exporter_.write_layer(layer, file_path.string())) {
            logger_.warning("Failed to write segment shapefile: " + file_path.string());
            continue;
        }
        names.push_back(name);
    }

    if (names.empty()) {
        std::filesystem::remove_all(base_dir, ec);
        last_error_ = "No segments were created; the AOI may be too small for the requested grid.";
        logger_.warning(last_error_);
        return false;
    }

    json settings = load_settings();
    settings["segmentation"]["metadata"][slug(aoi_name)] = to_metadata(result, names);
    if (!save_settings(settings)) {
        return false;
    }

    if (map_tile) {
        logger_.info("Created " + std::to_string(names.size()) + " map tiles (" +
                     (result.scale_label.empty() ? result.scale_key : result.scale_label) + ") for " +
                     aoi_name + " aligned to " + result.alignment + " grid.");
    } else {
        logger_.info("Created " + std::to_string(names.size()) + " segments for " + aoi_name + " in " +
                     std::to_string(result.rows) + "x" + std::to_string(result.cols) + " grid.");
    }
    return true;
}

bool SegmentStore::clear(const std::string& aoi_name) {
    last_error_.clear();
    std::error_code ec;
    std::filesystem::remove_all(paths_.segments_dir(aoi_name), ec);
    if (ec) {
        logger_.warning("Could not remove " + paths_.segments_dir(aoi_name).string() + ": " + ec.message());
    }

    json settings = load_settings();
    bool removed = false;
    const std::string key = slug(aoi_name);
    if (settings.contains("segmentation") && settings["segmentation"].contains("metadata")) {
        json& stored = settings["segmentation"]["metadata"];
        if (stored.is_object() && stored.contains(key)) {
            const json& entry = stored[key];
            removed = entry.contains("segments") && entry["segments"].is_array() && !entry["segments"].empty();
            stored.erase(key);
            if (!save_settings(settings)) {
                return false;
            }
        }
    }

    if (removed) {
        logger_.info("Removed stored segments for " + aoi_name + ".");
    } else {
        logger_.info("No stored segments found for " + aoi_name + ".");
    }
    return removed;
}

std::optional<json> SegmentStore::metadata(const std::string& aoi_name) const {
    const json settings = load_settings();
    const std::string key = slug(aoi_name);
    if (!settings.contains("segmentation")) {
        return std::nullopt;
    }
    const json& segmentation = settings["segmentation"];
    if (!segmentation.is_object() || !segmentation.contains("metadata")) {
        return std::nullopt;
    }
    const json& stored = segmentation["metadata"];
    if (!stored.is_object() || !stored.contains(key) || !stored[key].is_object()) {
        return std::nullopt;
    }
    return stored[key];
}

bool SegmentStore::has_segments(const std::string& aoi_name) const {
    auto entry = metadata(aoi_name);
    return entry && entry->contains("segments") && (*entry)["segments"].is_array() &&
           !(*entry)["segments"].empty();
}

} // namespace hexmosaic
