#pragma once

/**
 * @file AreaOfInterest.hpp
 * @brief Named polygonal area that the hex lattice and segments are built over
 */

#include "Geometry.hpp"
#include "SpatialReference.hpp"
#include <string>
#include <vector>

namespace hexmosaic {

class FeatureSource;

/**
 * @brief Area of interest
 *
 * `source` records where the geometry came from (a dataset path, or
 * "generated" for AOIs built from a centre point).
 */
struct AreaOfInterest {
    std::string name;
    Crs crs;
    Geometry geometry;
    std::string source;

    /// Repair problems met while building the geometry
    std::vector<std::string> warnings;

    /**
     * @brief Union of every polygon feature of a layer
     *
     * Features are repaired first; features that cannot be repaired are
     * skipped with a warning.
     *
     * @throws InvalidArgument if the layer is invalid or not polygonal
     */
    static AreaOfInterest from_source(const FeatureSource& source, const std::string& name = "");

    /**
     * @brief Rectangle of the given size in metres centred on a point
     *
     * A geographic CRS is replaced by the UTM zone that contains the
     * centre, so the rectangle and the returned AOI are in metres.
     *
     * @throws InvalidArgument if the size is not positive
     */
    static AreaOfInterest from_center(const std::string& name, const Crs& crs,
                                      const Point2D& center, double width_m, double height_m);

    BoundingBox bounds() const { return geometry.envelope(); }
};

/**
 * @brief Display name of a generated AOI: "AOI 3 2000m x 1500m"
 */
std::string aoi_display_name(int index, double width_m, double height_m);

/**
 * @brief Shapefile name of a generated AOI: "AOI_3_2000m_x_1500m_hint.shp"
 *
 * The hint is sanitised and omitted when empty.
 */
std::string aoi_file_name(int index, double width_m, double height_m, const std::string& hint = "");

/**
 * @brief One rectangular AOI per point, numbered from first_index
 */
std::vector<AreaOfInterest> aois_from_points(const std::vector<Point2D>& points, const Crs& crs,
                                             double width_m, double height_m, int first_index = 1);

} // namespace hexmosaic
