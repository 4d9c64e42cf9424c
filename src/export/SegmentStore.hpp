/**
 * @file SegmentStore.hpp
 * @brief Segment shapefiles and their metadata in the project settings file
 */

#pragma once

#include "hexmosaic.hpp"
#include "ShapefileExporter.hpp"
#include "../core/Logger.hpp"
#include "../core/ProjectPaths.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

struct SegmentationResult;

/**
 * @brief Persists segmentation runs per AOI
 *
 * Segment files live under Layers/Base/Base_Grid/{aoi}/Segments, map tiles
 * in a MapTiles_* subdirectory of it. The metadata entry is stored in
 * hexmosaic.project.json under segmentation.metadata, keyed by slug(aoi).
 * Other content of the settings file is preserved.
 */
class SegmentStore {
public:
    explicit SegmentStore(ProjectPaths paths);

    /**
     * @brief Replace the stored segments of an AOI
     *
     * Removes the AOI's Segments directory, writes one shapefile per cell
     * and records the metadata entry.
     *
     * @return true if at least one segment was written
     */
    bool write(const std::string& aoi_name, const SegmentationResult& result);

    /**
     * @brief Remove the segment files and metadata of an AOI
     * @return true if stored segments existed
     */
    bool clear(const std::string& aoi_name);

    std::optional<nlohmann::json> metadata(const std::string& aoi_name) const;

    bool has_segments(const std::string& aoi_name) const;

    /// Metadata entry for a result and the names of its written segments
    static nlohmann::json to_metadata(const SegmentationResult& result,
                                      const std::vector<std::string>& segment_names);

    const std::string& last_error() const { return last_error_; }

private:
    nlohmann::json load_settings() const;
    bool save_settings(const nlohmann::json& settings);

    ProjectPaths paths_;
    ShapefileExporter exporter_;
    std::string last_error_;
    Logger logger_;
};

} // namespace hexmosaic
