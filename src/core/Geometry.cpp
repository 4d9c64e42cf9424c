/**
 * @file Geometry.cpp
 * @brief OGR/GEOS backed implementation of the geometry value type
 */

#include "Geometry.hpp"
#include "Errors.hpp"
#include <ogr_geometry.h>
#include <cpl_error.h>
#include <cmath>
#include <utility>

namespace hexmosaic {

namespace {

void destroy_geometry(const OGRGeometry* geometry) {
    OGRGeometryFactory::destroyGeometry(const_cast<OGRGeometry*>(geometry));
}

/**
 * @brief Silences GEOS notices while a validity test or repair runs
 */
class QuietErrors {
public:
    QuietErrors() {
        CPLPushErrorHandler(CPLQuietErrorHandler);
        CPLErrorReset();
    }
    ~QuietErrors() { CPLPopErrorHandler(); }

    QuietErrors(const QuietErrors&) = delete;
    QuietErrors& operator=(const QuietErrors&) = delete;
};

bool is_collection(OGRwkbGeometryType type) {
    switch (type) {
        case wkbMultiPoint:
        case wkbMultiLineString:
        case wkbMultiPolygon:
        case wkbGeometryCollection:
        case wkbMultiCurve:
        case wkbMultiSurface:
            return true;
        default:
            return false;
    }
}

template <typename Visitor>
void for_each_polygon(const OGRGeometry* geometry, Visitor&& visit) {
    if (!geometry || geometry->IsEmpty()) return;
    const auto type = wkbFlatten(geometry->getGeometryType());
    if (type == wkbPolygon) {
        visit(geometry->toPolygon());
    } else if (type == wkbCurvePolygon || type == wkbMultiSurface) {
        std::unique_ptr<OGRGeometry, void (*)(const OGRGeometry*)> linear(
            geometry->getLinearGeometry(), destroy_geometry);
        if (linear) for_each_polygon(linear.get(), visit);
    } else if (is_collection(type)) {
        const auto* collection = geometry->toGeometryCollection();
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
            for_each_polygon(collection->getGeometryRef(i), visit);
        }
    }
}

template <typename Visitor>
void for_each_line(const OGRGeometry* geometry, Visitor&& visit) {
    if (!geometry || geometry->IsEmpty()) return;
    const auto type = wkbFlatten(geometry->getGeometryType());
    if (type == wkbLineString) {
        visit(geometry->toLineString());
    } else if (type == wkbCircularString || type == wkbCompoundCurve || type == wkbMultiCurve) {
        std::unique_ptr<OGRGeometry, void (*)(const OGRGeometry*)> linear(
            geometry->getLinearGeometry(), destroy_geometry);
        if (linear) for_each_line(linear.get(), visit);
    } else if (is_collection(type)) {
        const auto* collection = geometry->toGeometryCollection();
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
            for_each_line(collection->getGeometryRef(i), visit);
        }
    }
}

std::vector<Point2D> curve_points(const OGRSimpleCurve* curve) {
    std::vector<Point2D> points;
    points.reserve(static_cast<size_t>(curve->getNumPoints()));
    for (int i = 0; i < curve->getNumPoints(); ++i) {
        points.emplace_back(curve->getX(i), curve->getY(i));
    }
    return points;
}

GeometryKind kind_of(const OGRGeometry* geometry) {
    if (!geometry || geometry->IsEmpty()) {
        return GeometryKind::EMPTY;
    }

    switch (wkbFlatten(geometry->getGeometryType())) {
        case wkbPoint:
        case wkbMultiPoint:
            return GeometryKind::POINT;
        case wkbLineString:
        case wkbMultiLineString:
        case wkbCircularString:
        case wkbCompoundCurve:
        case wkbMultiCurve:
            return GeometryKind::LINE;
        case wkbPolygon:
        case wkbMultiPolygon:
        case wkbCurvePolygon:
        case wkbMultiSurface:
            return GeometryKind::POLYGON;
        case wkbGeometryCollection: {
            GeometryKind combined = GeometryKind::EMPTY;
            const auto* collection = geometry->toGeometryCollection();
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                GeometryKind member = kind_of(collection->getGeometryRef(i));
                if (member == GeometryKind::EMPTY) continue;
                if (combined == GeometryKind::EMPTY) {
                    combined = member;
                } else if (combined != member) {
                    return GeometryKind::MIXED;
                }
            }
            return combined;
        }
        default:
            return GeometryKind::MIXED;
    }
}

double area_of(const OGRGeometry* geometry) {
    double total = 0.0;
    for_each_polygon(geometry, [&total](const OGRPolygon* polygon) {
        total += polygon->get_Area();
    });
    return total;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Geometry::Geometry() = default;

Geometry::Geometry(std::shared_ptr<const OGRGeometry> geometry)
    : geom_(std::move(geometry)) {}

Geometry Geometry::wrap(OGRGeometry* owned) {
    if (!owned) {
        return Geometry();
    }
    if (owned->IsEmpty()) {
        destroy_geometry(owned);
        return Geometry();
    }
    return Geometry(std::shared_ptr<const OGRGeometry>(owned, destroy_geometry));
}

Geometry Geometry::from_wkt(const std::string& wkt) {
    OGRGeometry* parsed = nullptr;
    OGRErr err = OGRGeometryFactory::createFromWkt(wkt.c_str(), nullptr, &parsed);
    if (err != OGRERR_NONE) {
        if (parsed) destroy_geometry(parsed);
        throw InvalidArgument("Invalid WKT geometry: " + wkt.substr(0, 64));
    }
    return wrap(parsed);
}

Geometry Geometry::point(const Point2D& point) {
    return wrap(new OGRPoint(point.x(), point.y()));
}

Geometry Geometry::line_string(const std::vector<Point2D>& points) {
    if (points.size() < 2) {
        return Geometry();
    }
    auto* line = new OGRLineString();
    line->setNumPoints(static_cast<int>(points.size()));
    for (size_t i = 0; i < points.size(); ++i) {
        line->setPoint(static_cast<int>(i), points[i].x(), points[i].y());
    }
    return wrap(line);
}

Geometry Geometry::polygon(const std::vector<Point2D>& ring) {
    if (ring.size() < 3) {
        return Geometry();
    }
    auto* linear_ring = new OGRLinearRing();
    for (const auto& point : ring) {
        linear_ring->addPoint(point.x(), point.y());
    }
    linear_ring->closeRings();

    auto* polygon = new OGRPolygon();
    polygon->addRingDirectly(linear_ring);
    return wrap(polygon);
}

Geometry Geometry::rectangle(const BoundingBox& box) {
    return polygon({
        Point2D(box.min_x, box.min_y),
        Point2D(box.min_x, box.max_y),
        Point2D(box.max_x, box.max_y),
        Point2D(box.max_x, box.min_y)
    });
}

Geometry Geometry::unary_union(const std::vector<Geometry>& geometries) {
    std::vector<const Geometry*> present;
    bool all_polygonal = true;
    for (const auto& geometry : geometries) {
        if (geometry.is_empty()) continue;
        present.push_back(&geometry);
        if (!geometry.is_polygonal()) all_polygonal = false;
    }

    if (present.empty()) {
        return Geometry();
    }

    if (all_polygonal) {
        OGRMultiPolygon collected;
        for (const auto* geometry : present) {
            for_each_polygon(geometry->ogr(), [&collected](const OGRPolygon* polygon) {
                collected.addGeometry(polygon);
            });
        }
        return wrap(collected.UnionCascaded());
    }

    Geometry merged = *present.front();
    for (size_t i = 1; i < present.size(); ++i) {
        merged = merged.union_with(*present[i]);
    }
    return merged;
}

// ============================================================================
// Inspection
// ============================================================================

bool Geometry::is_empty() const {
    return !geom_ || geom_->IsEmpty();
}

bool Geometry::is_valid() const {
    if (is_empty()) return true;
    QuietErrors quiet;
    return geom_->IsValid();
}

GeometryKind Geometry::kind() const {
    return kind_of(geom_.get());
}

double Geometry::area() const {
    return area_of(geom_.get());
}

double Geometry::length() const {
    double total = 0.0;
    for_each_line(geom_.get(), [&total](const OGRLineString* line) {
        total += line->get_Length();
    });
    return total;
}

std::optional<Point2D> Geometry::centroid() const {
    if (is_empty()) return std::nullopt;

    OGRPoint center;
    if (geom_->Centroid(&center) != OGRERR_NONE || center.IsEmpty()) {
        return std::nullopt;
    }
    return Point2D(center.getX(), center.getY());
}

BoundingBox Geometry::envelope() const {
    if (is_empty()) return BoundingBox::null_box();

    OGREnvelope env;
    geom_->getEnvelope(&env);
    return BoundingBox(env.MinX, env.MinY, env.MaxX, env.MaxY);
}

// ============================================================================
// Overlay operations
// ============================================================================

Geometry Geometry::intersection(const Geometry& other) const {
    if (is_empty() || other.is_empty()) return Geometry();
    if (!envelope().intersects(other.envelope())) return Geometry();
    return wrap(geom_->Intersection(other.geom_.get()));
}

Geometry Geometry::union_with(const Geometry& other) const {
    if (is_empty()) return other;
    if (other.is_empty()) return *this;
    return wrap(geom_->Union(other.geom_.get()));
}

Geometry Geometry::buffer(double distance, int segments) const {
    if (is_empty()) return Geometry();
    return wrap(geom_->Buffer(distance, segments));
}

Geometry Geometry::boundary() const {
    if (is_empty()) return Geometry();
    return wrap(geom_->Boundary());
}

RepairResult Geometry::make_valid() const {
    if (is_empty()) {
        return {Geometry(), ""};
    }

    QuietErrors quiet;
    if (geom_->IsValid()) {
        return {*this, ""};
    }

    OGRGeometry* repaired = geom_->MakeValid();
    if (!repaired) {
        std::string message = CPLGetLastErrorMsg();
        if (message.empty()) {
            message = "geometry could not be made valid";
        }
        return {Geometry(), message};
    }
    return {wrap(repaired), ""};
}

Geometry Geometry::to_multi() const {
    if (is_empty()) return Geometry();

    OGRGeometry* copy = geom_->clone();
    switch (kind()) {
        case GeometryKind::POLYGON:
            return wrap(OGRGeometryFactory::forceToMultiPolygon(copy));
        case GeometryKind::LINE:
            return wrap(OGRGeometryFactory::forceToMultiLineString(copy));
        case GeometryKind::POINT:
            return wrap(OGRGeometryFactory::forceToMultiPoint(copy));
        default:
            return wrap(copy);
    }
}

Geometry Geometry::polygonal_part() const {
    auto* collected = new OGRMultiPolygon();
    for_each_polygon(geom_.get(), [collected](const OGRPolygon* polygon) {
        collected->addGeometry(polygon);
    });
    return wrap(collected);
}

Geometry Geometry::linear_part() const {
    auto* collected = new OGRMultiLineString();
    for_each_line(geom_.get(), [collected](const OGRLineString* line) {
        auto* copy = new OGRLineString();
        copy->addSubLineString(line);
        collected->addGeometryDirectly(copy);
    });
    return wrap(collected);
}

std::vector<Geometry> Geometry::parts() const {
    std::vector<Geometry> result;
    if (is_empty()) return result;

    if (!is_collection(wkbFlatten(geom_->getGeometryType()))) {
        result.push_back(*this);
        return result;
    }

    const auto* collection = geom_->toGeometryCollection();
    for (int i = 0; i < collection->getNumGeometries(); ++i) {
        Geometry part = wrap(collection->getGeometryRef(i)->clone());
        if (!part.is_empty()) {
            result.push_back(std::move(part));
        }
    }
    return result;
}

// ============================================================================
// Predicates and measurement
// ============================================================================

bool Geometry::contains(const Geometry& other) const {
    if (is_empty() || other.is_empty()) return false;
    return geom_->Contains(other.geom_.get());
}

bool Geometry::intersects(const Geometry& other) const {
    if (is_empty() || other.is_empty()) return false;
    return geom_->Intersects(other.geom_.get());
}

double Geometry::distance(const Geometry& other) const {
    if (is_empty() || other.is_empty()) return -1.0;
    return geom_->Distance(other.geom_.get());
}

std::optional<Point2D> Geometry::interpolate(double distance) const {
    const auto lines = paths();
    if (lines.empty()) return std::nullopt;

    double remaining = std::max(0.0, distance);
    const Point2D* last = nullptr;
    for (const auto& line : lines) {
        for (size_t i = 1; i < line.size(); ++i) {
            const double segment = line[i - 1].distance_to(line[i]);
            if (segment > 0.0 && remaining <= segment) {
                const double t = remaining / segment;
                return Point2D(line[i - 1].x() + t * (line[i].x() - line[i - 1].x()),
                               line[i - 1].y() + t * (line[i].y() - line[i - 1].y()));
            }
            remaining -= segment;
        }
        if (!line.empty()) last = &line.back();
    }

    if (last) return *last;
    return std::nullopt;
}

// ============================================================================
// Coordinate access
// ============================================================================

std::vector<std::vector<Point2D>> Geometry::rings() const {
    std::vector<std::vector<Point2D>> result;
    for_each_polygon(geom_.get(), [&result](const OGRPolygon* polygon) {
        const OGRLinearRing* exterior = polygon->getExteriorRing();
        if (!exterior) return;
        result.push_back(curve_points(exterior));
        for (int i = 0; i < polygon->getNumInteriorRings(); ++i) {
            result.push_back(curve_points(polygon->getInteriorRing(i)));
        }
    });
    return result;
}

std::vector<std::vector<Point2D>> Geometry::paths() const {
    std::vector<std::vector<Point2D>> result;
    for_each_line(geom_.get(), [&result](const OGRLineString* line) {
        result.push_back(curve_points(line));
    });
    return result;
}

std::string Geometry::to_wkt() const {
    if (is_empty()) return "GEOMETRYCOLLECTION EMPTY";
    return geom_->exportToWkt();
}

} // namespace hexmosaic
