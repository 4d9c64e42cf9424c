/**
 * @file AreaOfInterest.cpp
 * @brief AOI construction from layers and centre points
 */

#include "AreaOfInterest.hpp"
#include "Errors.hpp"
#include "FeatureSource.hpp"
#include "Logger.hpp"
#include "ProjectPaths.hpp"
#include <cmath>

namespace hexmosaic {

AreaOfInterest AreaOfInterest::from_source(const FeatureSource& source, const std::string& name) {
    Logger logger("AreaOfInterest");

    if (!source.is_valid()) {
        throw InvalidArgument("AOI layer is invalid.");
    }
    if (source.geometry_kind() != GeometryKind::POLYGON) {
        throw InvalidArgument("AOI layer must contain polygonal features.");
    }

    AreaOfInterest aoi;
    aoi.name = name.empty() ? source.name() : name;
    aoi.crs = source.crs();
    aoi.source = source.name();

    std::vector<Geometry> parts;
    for (const auto& feature : source.features()) {
        if (feature.geometry.is_empty()) {
            continue;
        }
        RepairResult repaired = feature.geometry.make_valid();
        if (!repaired.ok()) {
            std::string warning = "AOI feature " + std::to_string(feature.fid) +
                                  " could not be repaired: " + repaired.error;
            logger.warning(warning);
            aoi.warnings.push_back(warning);
            continue;
        }
        Geometry polygons = repaired.geometry.polygonal_part();
        if (!polygons.is_empty()) {
            parts.push_back(polygons);
        }
    }

    aoi.geometry = Geometry::unary_union(parts);
    logger.detailed("AOI '" + aoi.name + "' built from " + std::to_string(parts.size()) + " polygon(s)");
    return aoi;
}

AreaOfInterest AreaOfInterest::from_center(const std::string& name, const Crs& crs,
                                           const Point2D& center, double width_m, double height_m) {
    if (!(width_m > 0.0) || !(height_m > 0.0)) {
        throw InvalidArgument("Width/Height must be > 0.");
    }
    if (!crs.is_valid()) {
        throw InvalidArgument("AOI coordinate reference system is invalid.");
    }

    Crs target = crs;
    Point2D projected_center = center;
    if (crs.is_geographic()) {
        // Metre-sized rectangles are built in the UTM zone of the centre
        Crs lonlat = Crs::from_epsg(4326);
        Point2D lon_lat = CoordinateTransformer(crs, lonlat).transform_point(center);
        target = Crs::from_epsg(utm_epsg_for(lon_lat.x(), lon_lat.y()));
        projected_center = CoordinateTransformer(crs, target).transform_point(center);
    }

    const double units_w = width_m / target.meters_per_unit();
    const double units_h = height_m / target.meters_per_unit();

    AreaOfInterest aoi;
    aoi.name = name;
    aoi.crs = target;
    aoi.source = "generated";
    aoi.geometry = Geometry::rectangle(BoundingBox(
        projected_center.x() - units_w / 2.0, projected_center.y() - units_h / 2.0,
        projected_center.x() + units_w / 2.0, projected_center.y() + units_h / 2.0));
    return aoi;
}

std::string aoi_display_name(int index, double width_m, double height_m) {
    return "AOI " + std::to_string(index) + " " +
           std::to_string(static_cast<long long>(std::llround(width_m))) + "m x " +
           std::to_string(static_cast<long long>(std::llround(height_m))) + "m";
}

std::string aoi_file_name(int index, double width_m, double height_m, const std::string& hint) {
    std::string name = "AOI_" + std::to_string(index) + "_" +
                       std::to_string(static_cast<long long>(std::llround(width_m))) + "m_x_" +
                       std::to_string(static_cast<long long>(std::llround(height_m))) + "m";
    if (!hint.empty()) {
        name += "_" + hint;
    }
    return safe_filename(name + ".shp");
}

std::vector<AreaOfInterest> aois_from_points(const std::vector<Point2D>& points, const Crs& crs,
                                             double width_m, double height_m, int first_index) {
    std::vector<AreaOfInterest> aois;
    aois.reserve(points.size());
    int index = first_index;
    for (const auto& point : points) {
        aois.push_back(AreaOfInterest::from_center(aoi_display_name(index, width_m, height_m),
                                                   crs, point, width_m, height_m));
        ++index;
    }
    return aois;
}

} // namespace hexmosaic
