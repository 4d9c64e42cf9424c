#pragma once

/**
 * @file Geometry.hpp
 * @brief Immutable geometry value type over OGR geometries
 *
 * The tessellator, segmentation engine, sampler and classifier only see
 * this type. Operations never mutate their operands; anything that fails
 * inside the geometry engine returns an empty geometry.
 */

#include "hexmosaic.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class OGRGeometry;

namespace hexmosaic {

/**
 * @brief Dimension family of a geometry
 */
enum class GeometryKind {
    EMPTY,
    POINT,
    LINE,
    POLYGON,
    MIXED
};

struct RepairResult;

/**
 * @brief Shared, immutable handle to an OGR geometry
 */
class Geometry {
public:
    /// Empty geometry
    Geometry();

    // ------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------

    /**
     * @brief Parse well-known text
     * @throws InvalidArgument when the text is not valid WKT
     */
    static Geometry from_wkt(const std::string& wkt);

    static Geometry point(const Point2D& point);
    static Geometry line_string(const std::vector<Point2D>& points);

    /**
     * @brief Single-ring polygon; the ring is closed if needed
     */
    static Geometry polygon(const std::vector<Point2D>& ring);

    static Geometry rectangle(const BoundingBox& box);

    /**
     * @brief Union of all inputs, dissolving shared boundaries
     *
     * Empty inputs are ignored. Returns an empty geometry when nothing
     * remains or the engine fails.
     */
    static Geometry unary_union(const std::vector<Geometry>& geometries);

    /**
     * @brief Take ownership of a raw OGR geometry (nullptr gives empty)
     */
    static Geometry wrap(OGRGeometry* owned);

    // ------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------

    bool is_empty() const;
    bool is_valid() const;
    GeometryKind kind() const;
    bool is_polygonal() const { return kind() == GeometryKind::POLYGON; }
    bool is_linear() const { return kind() == GeometryKind::LINE; }

    double area() const;
    double length() const;
    std::optional<Point2D> centroid() const;
    BoundingBox envelope() const;

    // ------------------------------------------------------------------
    // Overlay and construction operations
    // ------------------------------------------------------------------

    Geometry intersection(const Geometry& other) const;
    Geometry union_with(const Geometry& other) const;
    Geometry buffer(double distance, int segments = 8) const;
    Geometry boundary() const;

    /**
     * @brief Repair an invalid geometry
     *
     * Valid input is returned unchanged. A failed repair yields an empty
     * geometry and a message; it never throws.
     */
    RepairResult make_valid() const;

    /// Multi-part form of a single-type geometry
    Geometry to_multi() const;

    /// Polygons found anywhere in the geometry, as a multipolygon
    Geometry polygonal_part() const;

    /// Line strings found anywhere in the geometry, as a multilinestring
    Geometry linear_part() const;

    std::vector<Geometry> parts() const;

    // ------------------------------------------------------------------
    // Predicates and measurement
    // ------------------------------------------------------------------

    bool contains(const Geometry& other) const;
    bool intersects(const Geometry& other) const;

    /// Minimum distance, or -1 when either operand is empty
    double distance(const Geometry& other) const;

    /**
     * @brief Point at a distance along the linear parts, walked in order
     *
     * Distances beyond the end clamp to the last vertex.
     */
    std::optional<Point2D> interpolate(double distance) const;

    // ------------------------------------------------------------------
    // Coordinate access
    // ------------------------------------------------------------------

    /// Every ring of every polygon part, exterior ring first per polygon
    std::vector<std::vector<Point2D>> rings() const;

    /// Vertex sequence of each linear part
    std::vector<std::vector<Point2D>> paths() const;

    std::string to_wkt() const;

    /// Underlying geometry for OGR I/O; nullptr when empty
    const OGRGeometry* ogr() const { return geom_.get(); }

private:
    explicit Geometry(std::shared_ptr<const OGRGeometry> geometry);

    std::shared_ptr<const OGRGeometry> geom_;
};

/**
 * @brief Outcome of a validity repair
 */
struct RepairResult {
    Geometry geometry;
    std::string error;

    bool ok() const { return error.empty(); }
};

} // namespace hexmosaic
