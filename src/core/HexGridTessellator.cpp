/**
 * @file HexGridTessellator.cpp
 * @brief Flat-top hexagon lattice generation and clipping
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "HexGridTessellator.hpp"
#include "Errors.hpp"
#include <cmath>
#include <set>
#include <sstream>
#include <utility>

namespace hexmosaic {

namespace {

constexpr double kSqrt3 = 1.7320508075688772;

// Coordinates are matched on a 1e-6 grid when deduplicating edges and vertices
constexpr double kDedupResolution = 1e-6;

using PointKey = std::pair<long long, long long>;

PointKey point_key(const Point2D& p) {
    return {std::llround(p.x() / kDedupResolution), std::llround(p.y() / kDedupResolution)};
}

std::string geographic_crs_message(const AreaOfInterest& aoi) {
    std::ostringstream msg;
    msg << "Hex tessellation needs a projected CRS in metres; AOI '" << aoi.name
        << "' uses a geographic CRS.";
    auto centroid = aoi.geometry.centroid();
    if (centroid) {
        try {
            Point2D lon_lat = CoordinateTransformer(aoi.crs, Crs::from_epsg(4326))
                                  .transform_point(*centroid);
            msg << " Reproject it first, e.g. to EPSG:" << utm_epsg_for(lon_lat.x(), lon_lat.y()) << ".";
        } catch (const HexMosaicError&) {
            // No suggestion when the centroid cannot be placed
        }
    }
    return msg.str();
}

} // namespace

HexCountEstimate estimate_hex_count(double width_m, double height_m, double cell_size_m) {
    HexCountEstimate estimate;
    if (cell_size_m <= 0.0) {
        return estimate;
    }
    estimate.width_hex = static_cast<int>(std::lround(width_m / cell_size_m));
    estimate.height_hex = static_cast<int>(std::lround(height_m / cell_size_m));
    return estimate;
}

double full_hexagon_area(double cell_size) {
    return kSqrt3 / 2.0 * cell_size * cell_size;
}

std::vector<Point2D> hexagon_ring(const Point2D& center, double cell_size) {
    const double radius = cell_size / kSqrt3;
    const double half_height = cell_size / 2.0;
    return {
        Point2D(center.x() + radius, center.y()),
        Point2D(center.x() + radius / 2.0, center.y() + half_height),
        Point2D(center.x() - radius / 2.0, center.y() + half_height),
        Point2D(center.x() - radius, center.y()),
        Point2D(center.x() - radius / 2.0, center.y() - half_height),
        Point2D(center.x() + radius / 2.0, center.y() - half_height),
        Point2D(center.x() + radius, center.y()),
    };
}

HexGridTessellator::HexGridTessellator() : logger_("HexGridTessellator") {}

TessellationResult HexGridTessellator::tessellate(const AreaOfInterest& aoi, double cell_size_m) const {
    if (!(cell_size_m > 0.0)) {
        throw InvalidArgument("Hex size must be greater than zero (got " + std::to_string(cell_size_m) + ").");
    }
    if (!aoi.crs.is_valid()) {
        throw InvalidArgument("AOI '" + aoi.name + "' has no valid coordinate reference system.");
    }

    TessellationResult result;
    result.crs = aoi.crs;
    result.cell_size_m = cell_size_m;

    Geometry area;
    if (!aoi.geometry.is_empty()) {
        RepairResult repaired = aoi.geometry.make_valid();
        if (!repaired.ok()) {
            result.warnings.push_back("AOI '" + aoi.name + "' could not be repaired: " + repaired.error);
        }
        area = repaired.geometry.polygonal_part();
    }
    if (area.is_empty() || area.area() <= 0.0) {
        result.warnings.push_back("AOI geometry is empty; tessellation skipped.");
        logger_.warning(result.warnings.back());
        return result;
    }

    if (aoi.crs.is_geographic()) {
        throw InvalidArgument(geographic_crs_message(aoi));
    }

    const double spacing = cell_size_m / aoi.crs.meters_per_unit();
    const double radius = spacing / kSqrt3;
    const double hex_area = full_hexagon_area(spacing);
    const BoundingBox box = area.envelope();

    logger_.detailed("Tessellating '" + aoi.name + "' at " + std::to_string(cell_size_m) +
                     " m (spacing " + std::to_string(spacing) + " CRS units)");

    std::int64_t next_id = 1;
    int column = 0;
    for (double cx = box.min_x + radius / 2.0; cx - radius < box.max_x; cx += 1.5 * radius, ++column) {
        const double top = (column % 2 == 0) ? box.max_y - spacing / 2.0 : box.max_y;
        for (double cy = top; cy + spacing / 2.0 > box.min_y; cy -= spacing) {
            const std::int64_t id = next_id++;
            Geometry hexagon = Geometry::polygon(hexagon_ring(Point2D(cx, cy), spacing));

            Geometry clipped;
            if (area.contains(hexagon)) {
                clipped = hexagon.to_multi();
            } else {
                Geometry piece = hexagon.intersection(area);
                if (piece.is_empty()) {
                    continue;
                }
                RepairResult repaired = piece.make_valid();
                if (!repaired.ok()) {
                    result.warnings.push_back("Hex " + std::to_string(id) + " could not be repaired: " +
                                              repaired.error);
                    logger_.warning(result.warnings.back());
                    continue;
                }
                clipped = repaired.geometry.polygonal_part();
            }

            const double clipped_area = clipped.area();
            if (clipped.is_empty() || clipped_area <= 0.0) {
                continue;
            }
            if (clipped_area > hex_area * (1.0 + 1e-9)) {
                logger_.debug("Hex " + std::to_string(id) + " larger than a full cell after clipping");
            }

            HexCell cell;
            cell.id = id;
            cell.geometry = clipped;
            cell.centroid = clipped.centroid().value_or(Point2D(cx, cy));
            result.cells.push_back(std::move(cell));
        }
    }

    for (const auto& cell : result.cells) {
        result.centroids.push_back(HexPoint{cell.id, cell.centroid});
    }
    derive_edges_and_vertices(result);

    logger_.info("Tessellated '" + aoi.name + "': " + std::to_string(result.cells.size()) + " hexes, " +
                 std::to_string(result.edges.size()) + " edges, " +
                 std::to_string(result.vertices.size()) + " vertices");
    if (result.cells.empty()) {
        result.warnings.push_back("No hex cells intersect AOI '" + aoi.name + "'.");
        logger_.warning(result.warnings.back());
    }
    return result;
}

void HexGridTessellator::derive_edges_and_vertices(TessellationResult& result) const {
    std::set<std::pair<PointKey, PointKey>> seen_edges;
    std::set<PointKey> seen_vertices;

    for (const auto& cell : result.cells) {
        for (const auto& ring : cell.geometry.rings()) {
            if (ring.size() < 2) {
                continue;
            }
            // The closing point repeats the first one
            for (size_t i = 0; i + 1 < ring.size(); ++i) {
                const Point2D& a = ring[i];
                const Point2D& b = ring[i + 1];

                PointKey ka = point_key(a);
                if (seen_vertices.insert(ka).second) {
                    result.vertices.push_back(
                        HexPoint{static_cast<std::int64_t>(result.vertices.size()) + 1, a});
                }

                PointKey kb = point_key(b);
                if (ka == kb) {
                    continue;
                }
                auto edge_key = ka < kb ? std::make_pair(ka, kb) : std::make_pair(kb, ka);
                if (seen_edges.insert(edge_key).second) {
                    result.edges.push_back(HexEdge{static_cast<std::int64_t>(result.edges.size()) + 1,
                                                   Geometry::line_string({a, b})});
                }
            }
        }
    }
    logger_.debug("Derived " + std::to_string(result.edges.size()) + " unique edges");
}

MemoryFeatureSource make_hex_layer(const TessellationResult& result, const std::string& name) {
    MemoryFeatureSource layer(name, result.crs, GeometryKind::POLYGON);
    layer.add_field(FieldDefinition("id", FieldType::INTEGER, 10));
    for (const auto& cell : result.cells) {
        layer.add_feature(cell.geometry, {FieldValue(cell.id)}, cell.id);
    }
    return layer;
}

} // namespace hexmosaic
