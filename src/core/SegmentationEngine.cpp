/**
 * @file SegmentationEngine.cpp
 * @brief Equal-grid and map-tile segmentation
 */

#include "SegmentationEngine.hpp"
#include "Errors.hpp"
#include "ProjectPaths.hpp"
#include "SpatialReference.hpp"
#include <cmath>

namespace hexmosaic {

namespace {

constexpr double kSnapEpsilon = 1e-9;

double round_up_to_increment(double value, double increment) {
    if (increment <= 0.0) {
        return value;
    }
    const double units = std::max(1.0, std::ceil(value / increment - kSnapEpsilon));
    return units * increment;
}

std::vector<double> edges_from(double start, double step, int count) {
    std::vector<double> edges;
    edges.reserve(static_cast<size_t>(count) + 1);
    for (int i = 0; i <= count; ++i) {
        edges.push_back(start + i * step);
    }
    return edges;
}

} // namespace

// ============================================================================
// Presets and enum conversions
// ============================================================================

const std::vector<ScalePreset>& map_tile_scale_presets() {
    static const std::vector<ScalePreset> presets = {
        {"1:25k", "1:25k (~5 km tile)", 5.0},
        {"1:50k", "1:50k (~10 km tile)", 10.0},
        {"1:100k", "1:100k (~20 km tile)", 20.0},
        {"1:200k", "1:200k (~40 km tile)", 40.0},
        {"1:250k", "1:250k (~50 km tile)", 50.0},
    };
    return presets;
}

const ScalePreset& find_scale_preset(const std::string& key) {
    for (const auto& preset : map_tile_scale_presets()) {
        if (preset.key == key) {
            return preset;
        }
    }
    throw InvalidArgument("Unknown map tile scale: '" + key + "' (expected 1:25k, 1:50k, 1:100k, 1:200k or 1:250k)");
}

TileAlignment parse_tile_alignment(const std::string& text) {
    if (text == "extent") return TileAlignment::EXTENT;
    if (text == "minute") return TileAlignment::MINUTE;
    if (text == "degree") return TileAlignment::DEGREE;
    throw InvalidArgument("Unknown tile alignment: '" + text + "' (expected extent, minute or degree)");
}

std::string to_string(TileAlignment alignment) {
    switch (alignment) {
        case TileAlignment::EXTENT: return "extent";
        case TileAlignment::MINUTE: return "minute";
        case TileAlignment::DEGREE: return "degree";
    }
    return "extent";
}

OffsetUnit parse_offset_unit(const std::string& text) {
    if (text == "km") return OffsetUnit::KILOMETERS;
    if (text == "arcmin") return OffsetUnit::ARC_MINUTES;
    throw InvalidArgument("Unknown offset unit: '" + text + "' (expected km or arcmin)");
}

std::string to_string(OffsetUnit unit) {
    return unit == OffsetUnit::ARC_MINUTES ? "arcmin" : "km";
}

std::string to_string(SegmentMode mode) {
    return mode == SegmentMode::MAP_TILE ? "map_tile" : "equal";
}

std::string segment_name(const SegmentationResult& result, const SegmentCell& cell) {
    const std::string rc = "R" + std::to_string(cell.row) + "C" + std::to_string(cell.col);
    if (result.mode == SegmentMode::MAP_TILE) {
        return result.parent + " - Tile " + result.scale_key + " " + rc;
    }
    return result.parent + " - Segment " + rc;
}

std::string segment_file_name(const SegmentationResult& result, const SegmentCell& cell) {
    if (result.mode == SegmentMode::MAP_TILE) {
        const std::string scale = safe_filename(result.scale_key.empty() ? "map_tiles" : result.scale_key);
        return safe_filename("Tile_" + scale + "_R" + std::to_string(cell.row) +
                             "_C" + std::to_string(cell.col) + ".shp");
    }
    return safe_filename("Segment_" + std::to_string(cell.row) + "_" + std::to_string(cell.col) + ".shp");
}

// ============================================================================
// SegmentationEngine
// ============================================================================

SegmentationEngine::SegmentationEngine() : logger_("SegmentationEngine") {}

Geometry SegmentationEngine::prepare_area(const AreaOfInterest& aoi, std::vector<std::string>& warnings) const {
    if (aoi.geometry.is_empty()) {
        return Geometry();
    }
    RepairResult repaired = aoi.geometry.make_valid();
    if (!repaired.ok()) {
        warnings.push_back("AOI '" + aoi.name + "' could not be repaired: " + repaired.error);
        logger_.warning(warnings.back());
        return Geometry();
    }
    return repaired.geometry.polygonal_part();
}

void SegmentationEngine::build_cells(const Geometry& area, const std::vector<double>& x_edges,
                                     const std::vector<double>& y_edges, SegmentationResult& result) const {
    const int rows = static_cast<int>(y_edges.size()) - 1;
    const int cols = static_cast<int>(x_edges.size()) - 1;

    for (int row_index = 0; row_index < rows; ++row_index) {
        // Row 1 is the top band
        const double y_min = y_edges[static_cast<size_t>(rows - row_index - 1)];
        const double y_max = y_edges[static_cast<size_t>(rows - row_index)];
        for (int col_index = 0; col_index < cols; ++col_index) {
            const double x_min = x_edges[static_cast<size_t>(col_index)];
            const double x_max = x_edges[static_cast<size_t>(col_index) + 1];

            SegmentCell cell;
            cell.row = row_index + 1;
            cell.col = col_index + 1;
            cell.id = static_cast<std::int64_t>(row_index) * cols + cell.col;

            Geometry piece = area.intersection(Geometry::rectangle(BoundingBox(x_min, y_min, x_max, y_max)));
            if (piece.is_empty()) {
                continue;
            }
            RepairResult repaired = piece.make_valid();
            if (!repaired.ok()) {
                result.warnings.push_back("Segment R" + std::to_string(cell.row) + "C" +
                                          std::to_string(cell.col) + " could not be repaired: " + repaired.error);
                logger_.warning(result.warnings.back());
                continue;
            }
            cell.geometry = repaired.geometry.polygonal_part();
            if (cell.geometry.is_empty()) {
                continue;
            }
            result.cells.push_back(std::move(cell));
        }
    }
}

SegmentationResult SegmentationEngine::segment_equal(const AreaOfInterest& aoi, int rows, int cols,
                                                     double snap_size) const {
    if (rows < 1 || cols < 1) {
        throw InvalidArgument("Rows and columns must be at least 1 (got " + std::to_string(rows) + " x " +
                              std::to_string(cols) + ").");
    }
    if (snap_size < 0.0) {
        throw InvalidArgument("Snap size must not be negative.");
    }

    SegmentationResult result;
    result.mode = SegmentMode::EQUAL;
    result.parent = aoi.name;
    result.crs = aoi.crs;
    result.rows = rows;
    result.cols = cols;
    result.alignment = "equal";

    Geometry area = prepare_area(aoi, result.warnings);
    if (area.is_empty()) {
        result.message = "AOI geometry is empty; segmentation skipped.";
        logger_.warning(result.message);
        return result;
    }

    const BoundingBox box = area.envelope();
    std::vector<double> x_edges;
    std::vector<double> y_edges;

    if (snap_size > 0.0) {
        const double grid_min_x = std::floor(box.min_x / snap_size) * snap_size;
        const double grid_max_x = std::ceil(box.max_x / snap_size) * snap_size;
        const double grid_min_y = std::floor(box.min_y / snap_size) * snap_size;
        const double grid_max_y = std::ceil(box.max_y / snap_size) * snap_size;

        auto cells_per_side = [snap_size](double span, int parts) {
            int cells = std::max(parts, static_cast<int>(std::ceil(span / snap_size - kSnapEpsilon)));
            if (cells % parts != 0) {
                cells = (cells / parts + 1) * parts;
            }
            return cells;
        };
        const double step_x = cells_per_side(grid_max_x - grid_min_x, cols) / cols * snap_size;
        const double step_y = cells_per_side(grid_max_y - grid_min_y, rows) / rows * snap_size;
        x_edges = edges_from(grid_min_x, step_x, cols);
        y_edges = edges_from(grid_min_y, step_y, rows);
        result.origin.project = Point2D(grid_min_x, grid_min_y);
    } else {
        x_edges = edges_from(box.min_x, box.width() / cols, cols);
        y_edges = edges_from(box.min_y, box.height() / rows, rows);
        // Close the grid on the exact bounding box
        x_edges.back() = box.max_x;
        y_edges.back() = box.max_y;
        result.origin.project = Point2D(box.min_x, box.min_y);
    }

    const double meters_per_unit = aoi.crs.is_valid() ? aoi.crs.meters_per_unit() : 1.0;
    result.tile_width_km = (x_edges[1] - x_edges[0]) * meters_per_unit / 1000.0;
    result.tile_height_km = (y_edges[1] - y_edges[0]) * meters_per_unit / 1000.0;

    build_cells(area, x_edges, y_edges, result);
    result.ok = !result.cells.empty();
    if (!result.ok) {
        result.message = "No segments were created; the AOI may be too small for the requested grid.";
        logger_.warning(result.message);
    } else {
        result.message = "Created " + std::to_string(result.cells.size()) + " segments for " + aoi.name +
                         " in " + std::to_string(rows) + "x" + std::to_string(cols) + " grid.";
        logger_.info(result.message);
    }
    return result;
}

SegmentationResult SegmentationEngine::segment_map_tile(const AreaOfInterest& aoi, const std::string& scale_key,
                                                        TileAlignment alignment,
                                                        const TileOffsets& offsets) const {
    const ScalePreset& preset = find_scale_preset(scale_key);

    SegmentationResult result;
    result.mode = SegmentMode::MAP_TILE;
    result.parent = aoi.name;
    result.crs = aoi.crs;
    result.alignment = to_string(alignment);
    result.offsets = offsets;
    result.scale_key = preset.key;
    result.scale_label = preset.label;
    result.subdir = "MapTiles_" + safe_filename(preset.key) + "_" + result.alignment;
    result.tile_width_km = preset.width_km;
    result.tile_height_km = preset.width_km;

    Geometry area = prepare_area(aoi, result.warnings);
    if (area.is_empty()) {
        result.message = "AOI geometry is empty; segmentation skipped.";
        logger_.warning(result.message);
        return result;
    }
    if (!aoi.crs.is_valid()) {
        throw InvalidArgument("AOI '" + aoi.name + "' has no valid coordinate reference system.");
    }

    const double tile_width_m = std::max(0.001, preset.width_km) * 1000.0;
    if (alignment == TileAlignment::EXTENT) {
        tile_by_extent(aoi, area, tile_width_m, result);
    } else {
        tile_geographic(aoi, area, tile_width_m, alignment, offsets, result);
    }

    if (result.ok) {
        result.message = "Created " + std::to_string(result.cells.size()) + " map tiles (" + result.scale_label +
                         ") for " + aoi.name + " aligned to " + result.alignment + " grid.";
        logger_.info(result.message);
    } else {
        logger_.warning(result.message);
    }
    return result;
}

void SegmentationEngine::tile_by_extent(const AreaOfInterest& aoi, const Geometry& area, double tile_width_m,
                                        SegmentationResult& result) const {
    const double tile = tile_width_m / aoi.crs.meters_per_unit();
    if (!(tile > 0.0)) {
        throw InvalidArgument("Tile width is too small.");
    }

    const BoundingBox box = area.envelope();
    const double grid_min_x = std::floor(box.min_x / tile) * tile;
    const double grid_max_x = std::ceil(box.max_x / tile) * tile;
    const double grid_min_y = std::floor(box.min_y / tile) * tile;
    const double grid_max_y = std::ceil(box.max_y / tile) * tile;

    result.cols = std::max(1, static_cast<int>(std::ceil((grid_max_x - grid_min_x) / tile)));
    result.rows = std::max(1, static_cast<int>(std::ceil((grid_max_y - grid_min_y) / tile)));

    logger_.debug("Extent grid " + std::to_string(result.rows) + "x" + std::to_string(result.cols) +
                  ", tile " + std::to_string(tile) + " CRS units");

    build_cells(area, edges_from(grid_min_x, tile, result.cols), edges_from(grid_min_y, tile, result.rows), result);
    if (result.cells.empty()) {
        result.message = "No intersection between AOI and computed tile grid.";
        return;
    }

    result.origin.project = Point2D(grid_min_x, grid_min_y);
    try {
        result.origin.geographic = CoordinateTransformer(aoi.crs, Crs::from_epsg(4326))
                                       .transform_point(Point2D(grid_min_x, grid_min_y));
    } catch (const HexMosaicError& e) {
        logger_.debug(std::string("Tile origin has no geographic position: ") + e.what());
    }

    result.tile_width_km = tile * aoi.crs.meters_per_unit() / 1000.0;
    result.tile_height_km = result.tile_width_km;
    result.ok = true;
}

void SegmentationEngine::tile_geographic(const AreaOfInterest& aoi, const Geometry& area, double tile_width_m,
                                         TileAlignment alignment, const TileOffsets& offsets,
                                         SegmentationResult& result) const {
    const Crs lonlat = Crs::from_epsg(4326);
    const CoordinateTransformer to_geo(aoi.crs, lonlat);
    const CoordinateTransformer from_geo(lonlat, aoi.crs);

    const BoundingBox bbox = to_geo.transform_bounds(area.envelope());
    const Point2D center = bbox.center();
    const MetersPerDegree mpd = meters_per_degree(center.x(), center.y());

    const double increment = alignment == TileAlignment::MINUTE ? 0.25 : 1.0;
    GeographicGrid grid;
    grid.meters_per_deg_lon = mpd.lon;
    grid.meters_per_deg_lat = mpd.lat;
    grid.tile_lon_deg = round_up_to_increment(tile_width_m / mpd.lon, increment);
    grid.tile_lat_deg = round_up_to_increment(tile_width_m / mpd.lat, increment);

    double offset_lat = 0.0;
    double offset_lon = 0.0;
    if (offsets.unit == OffsetUnit::ARC_MINUTES) {
        offset_lat = offsets.ns / 60.0;
        offset_lon = offsets.ew / 60.0;
    } else {
        offset_lat = offsets.ns * 1000.0 / mpd.lat;
        offset_lon = offsets.ew * 1000.0 / mpd.lon;
    }

    const double grid_min_lon = std::floor((bbox.min_x - offset_lon) / grid.tile_lon_deg) * grid.tile_lon_deg + offset_lon;
    const double grid_max_lon = std::ceil((bbox.max_x - offset_lon) / grid.tile_lon_deg) * grid.tile_lon_deg + offset_lon;
    const double grid_min_lat = std::floor((bbox.min_y - offset_lat) / grid.tile_lat_deg) * grid.tile_lat_deg + offset_lat;
    const double grid_max_lat = std::ceil((bbox.max_y - offset_lat) / grid.tile_lat_deg) * grid.tile_lat_deg + offset_lat;

    result.cols = std::max(1, static_cast<int>(std::ceil((grid_max_lon - grid_min_lon) / grid.tile_lon_deg - kSnapEpsilon)));
    result.rows = std::max(1, static_cast<int>(std::ceil((grid_max_lat - grid_min_lat) / grid.tile_lat_deg - kSnapEpsilon)));

    logger_.debug("Geographic grid " + std::to_string(result.rows) + "x" + std::to_string(result.cols) +
                  ", tile " + std::to_string(grid.tile_lon_deg) + " x " + std::to_string(grid.tile_lat_deg) + " deg");

    const auto lon_edges = edges_from(grid_min_lon, grid.tile_lon_deg, result.cols);
    const auto lat_edges = edges_from(grid_min_lat, grid.tile_lat_deg, result.rows);

    for (int row_index = 0; row_index < result.rows; ++row_index) {
        const double lat_bottom = lat_edges[static_cast<size_t>(result.rows - row_index - 1)];
        const double lat_top = lat_edges[static_cast<size_t>(result.rows - row_index)];
        for (int col_index = 0; col_index < result.cols; ++col_index) {
            const double lon_left = lon_edges[static_cast<size_t>(col_index)];
            const double lon_right = lon_edges[static_cast<size_t>(col_index) + 1];

            Geometry tile;
            try {
                tile = Geometry::polygon({
                    from_geo.transform_point(Point2D(lon_left, lat_bottom)),
                    from_geo.transform_point(Point2D(lon_left, lat_top)),
                    from_geo.transform_point(Point2D(lon_right, lat_top)),
                    from_geo.transform_point(Point2D(lon_right, lat_bottom)),
                });
            } catch (const InvalidArgument& e) {
                result.cells.clear();
                result.message = e.what();
                return;
            }

            SegmentCell cell;
            cell.row = row_index + 1;
            cell.col = col_index + 1;
            cell.id = static_cast<std::int64_t>(row_index) * result.cols + cell.col;

            Geometry piece = area.intersection(tile);
            if (piece.is_empty()) {
                continue;
            }
            RepairResult repaired = piece.make_valid();
            if (!repaired.ok()) {
                result.warnings.push_back("Tile R" + std::to_string(cell.row) + "C" + std::to_string(cell.col) +
                                          " could not be repaired: " + repaired.error);
                logger_.warning(result.warnings.back());
                continue;
            }
            cell.geometry = repaired.geometry.polygonal_part();
            if (!cell.geometry.is_empty()) {
                result.cells.push_back(std::move(cell));
            }
        }
    }

    if (result.cells.empty()) {
        result.message = "No intersection between AOI and snapped map tiles.";
        return;
    }

    result.origin.geographic = Point2D(grid_min_lon, grid_min_lat);
    try {
        result.origin.project = from_geo.transform_point(Point2D(grid_min_lon, grid_min_lat));
    } catch (const InvalidArgument& e) {
        logger_.debug(std::string("Tile origin has no projected position: ") + e.what());
    }

    result.tile_width_km = grid.tile_lon_deg * grid.meters_per_deg_lon / 1000.0;
    result.tile_height_km = grid.tile_lat_deg * grid.meters_per_deg_lat / 1000.0;
    result.grid = grid;
    result.ok = true;
}

} // namespace hexmosaic
