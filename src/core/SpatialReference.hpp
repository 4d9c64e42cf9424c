#pragma once

/**
 * @file SpatialReference.hpp
 * @brief Coordinate reference systems, transforms and geodesic measurement
 */

#include "hexmosaic.hpp"
#include "Geometry.hpp"
#include <memory>
#include <string>

class OGRSpatialReference;

namespace hexmosaic {

/**
 * @brief Coordinate reference system handle
 *
 * Axis order is always traditional GIS order (x = easting/longitude),
 * whatever the authority definition says.
 */
class Crs {
public:
    /// Invalid CRS
    Crs();

    /**
     * @brief Create from "EPSG:xxxx", WKT, or a PROJ string
     * @throws InvalidArgument if the definition is not understood
     */
    static Crs from_user_input(const std::string& definition);

    static Crs from_epsg(int code);

    /// Clone an OGR spatial reference (nullptr gives an invalid CRS)
    static Crs from_ogr(const OGRSpatialReference* srs);

    bool is_valid() const { return static_cast<bool>(srs_); }
    bool is_geographic() const;

    /**
     * @brief Length of one CRS unit in metres
     *
     * Degrees use the equatorial approximation (111319.49 m).
     */
    double meters_per_unit() const;

    bool same_as(const Crs& other) const;

    /// "EPSG:32633" style identifier, or an empty string
    std::string auth_id() const;

    std::string to_wkt() const;

    const OGRSpatialReference* ogr() const { return srs_.get(); }

private:
    std::shared_ptr<OGRSpatialReference> srs_;
};

/**
 * @brief Transforms coordinates between two CRSs
 *
 * Same-CRS pairs skip the projection engine.
 */
class CoordinateTransformer {
public:
    /**
     * @throws InvalidArgument when either CRS is invalid or no
     *         transformation path exists
     */
    CoordinateTransformer(const Crs& source, const Crs& target);
    ~CoordinateTransformer();

    CoordinateTransformer(const CoordinateTransformer&) = delete;
    CoordinateTransformer& operator=(const CoordinateTransformer&) = delete;

    bool is_identity() const;

    /// @throws InvalidArgument("Coordinate transform failed: ...")
    Point2D transform_point(const Point2D& point) const;

    /// @throws InvalidArgument("Coordinate transform failed: ...")
    Geometry transform_geometry(const Geometry& geometry) const;

    /**
     * @brief Transform a box, sampling each edge so curved edges are covered
     * @param densify Points per edge
     */
    BoundingBox transform_bounds(const BoundingBox& box, int densify = 21) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Metres spanned by one degree at a location
 */
struct MetersPerDegree {
    double lon;
    double lat;
};

/**
 * @brief Measure one degree of longitude and latitude on the WGS84 ellipsoid
 *
 * Falls back to 111320 m (latitude) and 111320 * max(0.1, cos(lat)) m
 * (longitude) if the geodesic solution is unusable.
 */
MetersPerDegree meters_per_degree(double lon, double lat);

/**
 * @brief Geodesic distance in metres between two lon/lat points on WGS84
 */
double geodesic_distance(const Point2D& from, const Point2D& to);

/**
 * @brief EPSG code of the WGS84 UTM zone containing a lon/lat point
 *
 * 326xx north of the equator, 327xx south of it.
 */
int utm_epsg_for(double lon, double lat);

} // namespace hexmosaic
