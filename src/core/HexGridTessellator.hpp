#pragma once

/**
 * @file HexGridTessellator.hpp
 * @brief Clipped hexagon lattice over an area of interest
 *
 * Hexagons are flat-top. The cell size is the centre-to-centre spacing of
 * neighbouring cells, which is also the flat-to-flat width of one cell.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "hexmosaic.hpp"
#include "AreaOfInterest.hpp"
#include "FeatureSource.hpp"
#include "Geometry.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief One cell of the lattice after clipping to the AOI
 */
struct HexCell {
    std::int64_t id = 0;        ///< Lattice id, 1-based, column-major
    Geometry geometry;          ///< Repaired multipolygon
    Point2D centroid;
};

/**
 * @brief Derived point with the id it belongs to
 *
 * Centroid ids equal their cell's id; vertex ids are sequential.
 */
struct HexPoint {
    std::int64_t id = 0;
    Point2D position;
};

struct HexEdge {
    std::int64_t id = 0;
    Geometry geometry;          ///< Two-point line string
};

/**
 * @brief Output of one tessellation request
 *
 * Edges, vertices and centroids are independent derived sets, not
 * parallel arrays of the cells.
 */
struct TessellationResult {
    Crs crs;
    double cell_size_m = 0.0;
    std::vector<HexCell> cells;
    std::vector<HexEdge> edges;
    std::vector<HexPoint> vertices;
    std::vector<HexPoint> centroids;
    std::vector<std::string> warnings;

    bool empty() const { return cells.empty(); }
};

/**
 * @brief Rough lattice size of a rectangular AOI, in hexes per side
 */
struct HexCountEstimate {
    int width_hex = 0;
    int height_hex = 0;

    int total() const { return width_hex * height_hex; }

    /// True if either side has more than `limit` hexes
    bool exceeds(int limit) const { return width_hex > limit || height_hex > limit; }
};

HexCountEstimate estimate_hex_count(double width_m, double height_m, double cell_size_m);

/// Area of an unclipped hexagon with the given flat-to-flat width
double full_hexagon_area(double cell_size);

/**
 * @brief Closed vertex ring of a flat-top hexagon (7 points, first repeated)
 */
std::vector<Point2D> hexagon_ring(const Point2D& center, double cell_size);

/**
 * @brief Hex-grid tessellator
 */
class HexGridTessellator {
public:
    HexGridTessellator();

    /**
     * @brief Build the clipped hex lattice and its derived layers
     *
     * An AOI that is empty after repair gives an empty result with a
     * warning.
     *
     * @param aoi Area of interest in a projected CRS
     * @param cell_size_m Centre-to-centre spacing in metres
     * @throws InvalidArgument when the cell size is not positive, the AOI
     *         CRS is invalid, or the AOI CRS is geographic
     */
    TessellationResult tessellate(const AreaOfInterest& aoi, double cell_size_m) const;

    const Logger& get_logger() const { return logger_; }

private:
    void derive_edges_and_vertices(TessellationResult& result) const;

    Logger logger_;
};

/**
 * @brief Hex cells as a feature layer with an integer `id` field
 *
 * Feature fids equal the cell ids.
 */
MemoryFeatureSource make_hex_layer(const TessellationResult& result, const std::string& name);

} // namespace hexmosaic
