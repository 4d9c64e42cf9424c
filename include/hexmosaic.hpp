#pragma once

/**
 * @file hexmosaic.hpp
 * @brief Main header for the HexMosaic map builder
 *
 * Shared value types and the run configuration used by the hex-grid
 * tessellator, the segmentation engine, the elevation sampler and the
 * feature classifier.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

// ============================================================================
// Basic geometry value types
// ============================================================================

/**
 * @brief 2D point with x, y coordinates (easting/longitude first)
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    Point2D& operator=(const Point2D& other) = default;

    bool operator==(const Point2D& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }

    double distance_to(const Point2D& other) const {
        return std::hypot(x_ - other.x_, y_ - other.y_);
    }
};

/**
 * @brief Axis-aligned bounding box in the units of its coordinate system
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    static BoundingBox null_box() {
        const double inf = std::numeric_limits<double>::infinity();
        return BoundingBox(inf, inf, -inf, -inf);
    }

    bool is_null() const { return min_x > max_x || min_y > max_y; }

    bool contains(const Point2D& point) const {
        return point.x() >= min_x && point.x() <= max_x &&
               point.y() >= min_y && point.y() <= max_y;
    }

    bool intersects(const BoundingBox& other) const {
        return !(other.min_x > max_x || other.max_x < min_x ||
                 other.min_y > max_y || other.max_y < min_y);
    }

    void expand(const Point2D& point) {
        min_x = std::min(min_x, point.x());
        min_y = std::min(min_y, point.y());
        max_x = std::max(max_x, point.x());
        max_y = std::max(max_y, point.y());
    }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    Point2D center() const { return Point2D((min_x + max_x) / 2.0, (min_y + max_y) / 2.0); }
};

// ============================================================================
// Enumerations shared across components
// ============================================================================

/**
 * @brief Per-hex aggregate taken from the elevation raster
 */
enum class SamplingMethod {
    MEAN,
    MEDIAN,
    MIN
};

/**
 * @brief How a traced line is drawn onto the hex lattice
 */
enum class LineBehavior {
    CENTROID_PATH,  ///< Polyline through the centroids of visited hexes
    EDGE_PATH       ///< Union of the edges shared by consecutive hexes
};

/**
 * @brief Grid alignment for map-tile segmentation
 */
enum class TileAlignment {
    EXTENT,  ///< Multiples of the tile width in native CRS units
    MINUTE,  ///< Geographic lattice rounded to 15 arc-minutes
    DEGREE   ///< Geographic lattice rounded to whole degrees
};

/**
 * @brief Unit of a map-tile origin offset
 */
enum class OffsetUnit {
    KILOMETERS,
    ARC_MINUTES
};

// ============================================================================
// Run configuration
// ============================================================================

/**
 * @brief Configuration for a HexMosaic run
 *
 * Values come from hexmosaic.config.json and may be overridden on the
 * command line.
 */
struct HexMosaicConfig {
    static constexpr int kSchemaVersion = 1;

    // Project layout
    std::string project_directory = ".";
    std::optional<std::string> config_file;

    // Tessellation
    double hex_size_m = 500.0;
    int max_hexes_without_experimental = 99;
    bool experimental = false;

    // Elevation sampling
    SamplingMethod sampling_method = SamplingMethod::MEAN;
    double bucket_size = 10.0;

    // Segmentation
    std::string default_scale = "1:250k";
    TileAlignment default_alignment = TileAlignment::EXTENT;
    double offset_ns = 0.0;
    double offset_ew = 0.0;
    OffsetUnit offset_unit = OffsetUnit::KILOMETERS;

    // Mosaic classes
    double area_threshold = 0.0;
    double line_buffer_m = 30.0;
    double line_step_m = 200.0;
    LineBehavior line_behavior = LineBehavior::CENTROID_PATH;

    // Logging
    std::string log_level = "3";
    std::optional<std::string> log_file;
};

} // namespace hexmosaic
