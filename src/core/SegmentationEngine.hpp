#pragma once

/**
 * @file SegmentationEngine.hpp
 * @brief Partition an AOI into equal row/column segments or scale-aligned map tiles
 */

#include "hexmosaic.hpp"
#include "AreaOfInterest.hpp"
#include "Geometry.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief Cartographic scale with its nominal tile width
 */
struct ScalePreset {
    std::string key;        ///< "1:250k"
    std::string label;      ///< "1:250k (~50 km tile)"
    double width_km;
};

/// All supported scales, smallest tile first
const std::vector<ScalePreset>& map_tile_scale_presets();

/**
 * @brief Look up a scale by key
 * @throws InvalidArgument for an unknown key
 */
const ScalePreset& find_scale_preset(const std::string& key);

/// @throws InvalidArgument for anything but extent, minute or degree
TileAlignment parse_tile_alignment(const std::string& text);
std::string to_string(TileAlignment alignment);

/// @throws InvalidArgument for anything but km or arcmin
OffsetUnit parse_offset_unit(const std::string& text);
std::string to_string(OffsetUnit unit);

/**
 * @brief Origin shift of a geographic tile lattice
 *
 * ns shifts latitude, ew shifts longitude. Ignored by extent alignment.
 */
struct TileOffsets {
    double ns = 0.0;
    double ew = 0.0;
    OffsetUnit unit = OffsetUnit::KILOMETERS;
};

struct SegmentCell {
    std::int64_t id = 0;        ///< (row - 1) * cols + col; gaps where cells are empty
    int row = 0;                ///< 1 = northernmost
    int col = 0;                ///< 1 = westernmost
    Geometry geometry;          ///< Rectangle intersected with the AOI, multipart
};

/**
 * @brief Lower-left corner of the tile lattice
 */
struct TileOrigin {
    std::optional<Point2D> project;     ///< In the AOI CRS
    std::optional<Point2D> geographic;  ///< lon/lat
};

/**
 * @brief Geographic lattice parameters of minute/degree alignment
 */
struct GeographicGrid {
    double tile_lon_deg = 0.0;
    double tile_lat_deg = 0.0;
    double meters_per_deg_lon = 0.0;
    double meters_per_deg_lat = 0.0;
};

enum class SegmentMode {
    EQUAL,
    MAP_TILE
};

std::string to_string(SegmentMode mode);

/**
 * @brief Segmentation output with everything needed to persist and rebuild it
 *
 * When `ok` is false `message` says why no cells were produced.
 */
struct SegmentationResult {
    bool ok = false;
    std::string message;

    SegmentMode mode = SegmentMode::EQUAL;
    std::string parent;
    Crs crs;
    int rows = 0;
    int cols = 0;
    std::vector<SegmentCell> cells;

    std::string alignment;          ///< "equal", "extent", "minute" or "degree"
    TileOffsets offsets;
    TileOrigin origin;
    double tile_width_km = 0.0;
    double tile_height_km = 0.0;
    std::optional<GeographicGrid> grid;

    std::string scale_key;
    std::string scale_label;
    std::string subdir;             ///< Map tiles only: MapTiles_{scale}_{alignment}

    std::vector<std::string> warnings;
};

/// "{parent} - Segment R1C2" or "{parent} - Tile 1:250k R1C2"
std::string segment_name(const SegmentationResult& result, const SegmentCell& cell);

/// "Segment_1_2.shp" or "Tile_1_250k_R1_C2.shp"
std::string segment_file_name(const SegmentationResult& result, const SegmentCell& cell);

/**
 * @brief Segmentation engine
 */
class SegmentationEngine {
public:
    SegmentationEngine();

    /**
     * @brief Divide the AOI bounding box into rows x cols equal rectangles
     *
     * With snap_size > 0 the grid origin is floored to a multiple of
     * snap_size and the steps are whole multiples of it, so segment
     * borders follow the hex spacing.
     *
     * @throws InvalidArgument if rows or cols is below 1 or snap_size is negative
     */
    SegmentationResult segment_equal(const AreaOfInterest& aoi, int rows, int cols,
                                     double snap_size = 0.0) const;

    /**
     * @brief Cover the AOI with map tiles of a cartographic scale
     * @throws InvalidArgument for an unknown scale key
     */
    SegmentationResult segment_map_tile(const AreaOfInterest& aoi, const std::string& scale_key,
                                        TileAlignment alignment,
                                        const TileOffsets& offsets = TileOffsets()) const;

private:
    /// Repaired polygonal AOI geometry, or empty
    Geometry prepare_area(const AreaOfInterest& aoi, std::vector<std::string>& warnings) const;

    void build_cells(const Geometry& area, const std::vector<double>& x_edges,
                     const std::vector<double>& y_edges, SegmentationResult& result) const;

    void tile_by_extent(const AreaOfInterest& aoi, const Geometry& area, double tile_width_m,
                        SegmentationResult& result) const;

    void tile_geographic(const AreaOfInterest& aoi, const Geometry& area, double tile_width_m,
                         TileAlignment alignment, const TileOffsets& offsets,
                         SegmentationResult& result) const;

    Logger logger_;
};

} // namespace hexmosaic
