#pragma once

/**
 * @file HexIndex.hpp
 * @brief Spatial index over the cells of one hex lattice
 */

#include "hexmosaic.hpp"
#include "Geometry.hpp"
#include "SpatialReference.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

class FeatureSource;
struct TessellationResult;

struct IndexedHex {
    std::int64_t id = 0;
    Geometry geometry;
    Point2D centroid;
    double area = 0.0;
    BoundingBox bounds;
};

/**
 * @brief Quad-tree index of hex cells for point lookup
 *
 * Built fresh from one hex layer and never shared across regenerations.
 *
 * Boundary points: candidates are tested in ascending id order, so a
 * point on an edge shared by two cells belongs to the lower id. The same
 * rule breaks ties in nearest().
 */
class HexIndex {
public:
    /**
     * @brief Index a hex layer
     *
     * Cell ids come from an integer `id` field when the layer has one,
     * otherwise from the feature ids. Cells that cannot be repaired are
     * skipped with a warning.
     */
    explicit HexIndex(const FeatureSource& hexes);

    explicit HexIndex(const TessellationResult& tessellation);

    ~HexIndex();

    HexIndex(const HexIndex&) = delete;
    HexIndex& operator=(const HexIndex&) = delete;

    /// Cell containing the point, boundary included (1e-9 tolerance)
    std::optional<std::int64_t> containing(const Point2D& point) const;

    /// Cell closest to the point
    std::optional<std::int64_t> nearest(const Point2D& point) const;

    /// containing(), falling back to nearest()
    std::optional<std::int64_t> locate(const Point2D& point) const;

    /// Ids of cells whose bounds intersect the box, ascending
    std::vector<std::int64_t> candidates(const BoundingBox& box) const;

    const IndexedHex* find(std::int64_t id) const;

    const std::vector<IndexedHex>& cells() const;

    /**
     * @brief Approximate hex spacing: larger side of the first cell's
     *        bounds, or 200 for an empty index
     */
    double estimated_spacing() const;

    const Crs& crs() const;

    const std::vector<std::string>& warnings() const;

    std::size_t size() const { return cells().size(); }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hexmosaic
