/**
 * @file SpatialReference.cpp
 * @brief CRS handling on OGRSpatialReference, geodesics on PROJ
 */

#include "SpatialReference.hpp"
#include "Errors.hpp"
#include <ogr_spatialref.h>
#include <ogr_geometry.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <geodesic.h>
#include <algorithm>
#include <cmath>
#include <vector>

namespace hexmosaic {

namespace {

constexpr double kWgs84SemiMajor = 6378137.0;
constexpr double kWgs84Flattening = 1.0 / 298.257223563;
constexpr double kMetersPerDegreeFallback = 111320.0;
constexpr double kDegreeToMeters = 111319.49079327357;
constexpr double kPi = 3.14159265358979323846;

std::shared_ptr<OGRSpatialReference> make_srs() {
    auto srs = std::shared_ptr<OGRSpatialReference>(
        new OGRSpatialReference(), [](OGRSpatialReference* p) { p->Release(); });
    srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

std::string last_cpl_error(const std::string& fallback) {
    std::string message = CPLGetLastErrorMsg();
    return message.empty() ? fallback : message;
}

} // namespace

// ============================================================================
// Crs
// ============================================================================

Crs::Crs() = default;

Crs Crs::from_user_input(const std::string& definition) {
    Crs crs;
    auto srs = make_srs();
    CPLErrorReset();
    if (definition.empty() || srs->SetFromUserInput(definition.c_str()) != OGRERR_NONE) {
        throw InvalidArgument("Unrecognised coordinate reference system: '" + definition + "'");
    }
    crs.srs_ = std::move(srs);
    return crs;
}

Crs Crs::from_epsg(int code) {
    Crs crs;
    auto srs = make_srs();
    if (srs->importFromEPSG(code) != OGRERR_NONE) {
        throw InvalidArgument("Unknown EPSG code: " + std::to_string(code));
    }
    crs.srs_ = std::move(srs);
    return crs;
}

Crs Crs::from_ogr(const OGRSpatialReference* source) {
    Crs crs;
    if (!source) {
        return crs;
    }
    crs.srs_ = std::shared_ptr<OGRSpatialReference>(
        source->Clone(), [](OGRSpatialReference* p) { p->Release(); });
    crs.srs_->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return crs;
}

bool Crs::is_geographic() const {
    return srs_ && srs_->IsGeographic();
}

double Crs::meters_per_unit() const {
    if (!srs_) return 1.0;
    if (srs_->IsGeographic()) {
        return kDegreeToMeters;
    }
    const double factor = srs_->GetLinearUnits();
    return factor > 0.0 ? factor : 1.0;
}

bool Crs::same_as(const Crs& other) const {
    if (!srs_ || !other.srs_) {
        return !srs_ && !other.srs_;
    }
    if (srs_ == other.srs_) {
        return true;
    }
    const char* options[] = {"IGNORE_DATA_AXIS_TO_SRS_AXIS_MAPPING=YES", nullptr};
    return srs_->IsSame(other.srs_.get(), options);
}

std::string Crs::auth_id() const {
    if (!srs_) return "";
    const char* name = srs_->GetAuthorityName(nullptr);
    const char* code = srs_->GetAuthorityCode(nullptr);
    if (!name || !code) {
        return "";
    }
    return std::string(name) + ":" + code;
}

std::string Crs::to_wkt() const {
    if (!srs_) return "";
    char* wkt = nullptr;
    if (srs_->exportToWkt(&wkt) != OGRERR_NONE) {
        CPLFree(wkt);
        return "";
    }
    std::string result = wkt ? wkt : "";
    CPLFree(wkt);
    return result;
}

// ============================================================================
// CoordinateTransformer
// ============================================================================

class CoordinateTransformer::Impl {
public:
    Impl(const Crs& source, const Crs& target) {
        if (!source.is_valid() || !target.is_valid()) {
            throw InvalidArgument("Coordinate transform failed: source or target CRS is invalid");
        }
        identity_ = source.same_as(target);
        if (!identity_) {
            CPLErrorReset();
            transform_.reset(OGRCreateCoordinateTransformation(source.ogr(), target.ogr()));
            if (!transform_) {
                throw InvalidArgument("Coordinate transform failed: " +
                    last_cpl_error("no path from " + source.auth_id() + " to " + target.auth_id()));
            }
        }
    }

    struct TransformDeleter {
        void operator()(OGRCoordinateTransformation* ct) const {
            OGRCoordinateTransformation::DestroyCT(ct);
        }
    };

    bool identity_ = false;
    std::unique_ptr<OGRCoordinateTransformation, TransformDeleter> transform_;
};

CoordinateTransformer::CoordinateTransformer(const Crs& source, const Crs& target)
    : impl_(std::make_unique<Impl>(source, target)) {}

CoordinateTransformer::~CoordinateTransformer() = default;

bool CoordinateTransformer::is_identity() const {
    return impl_->identity_;
}

Point2D CoordinateTransformer::transform_point(const Point2D& point) const {
    if (impl_->identity_) {
        return point;
    }
    double x = point.x();
    double y = point.y();
    CPLErrorReset();
    if (!impl_->transform_->Transform(1, &x, &y) || !std::isfinite(x) || !std::isfinite(y)) {
        throw InvalidArgument("Coordinate transform failed: " +
            last_cpl_error("point is outside the area of use"));
    }
    return Point2D(x, y);
}

Geometry CoordinateTransformer::transform_geometry(const Geometry& geometry) const {
    if (impl_->identity_ || geometry.is_empty()) {
        return geometry;
    }
    OGRGeometry* copy = geometry.ogr()->clone();
    CPLErrorReset();
    if (copy->transform(impl_->transform_.get()) != OGRERR_NONE) {
        OGRGeometryFactory::destroyGeometry(copy);
        throw InvalidArgument("Coordinate transform failed: " +
            last_cpl_error("geometry could not be reprojected"));
    }
    return Geometry::wrap(copy);
}

BoundingBox CoordinateTransformer::transform_bounds(const BoundingBox& box, int densify) const {
    if (impl_->identity_) {
        return box;
    }
    const int steps = std::max(2, densify);
    BoundingBox result = BoundingBox::null_box();
    for (int i = 0; i < steps; ++i) {
        const double t = static_cast<double>(i) / (steps - 1);
        const double x = box.min_x + t * box.width();
        const double y = box.min_y + t * box.height();
        result.expand(transform_point(Point2D(x, box.min_y)));
        result.expand(transform_point(Point2D(x, box.max_y)));
        result.expand(transform_point(Point2D(box.min_x, y)));
        result.expand(transform_point(Point2D(box.max_x, y)));
    }
    return result;
}

// ============================================================================
// Geodesic helpers
// ============================================================================

double geodesic_distance(const Point2D& from, const Point2D& to) {
    struct geod_geodesic geod;
    geod_init(&geod, kWgs84SemiMajor, kWgs84Flattening);
    double distance = 0.0;
    geod_inverse(&geod, from.y(), from.x(), to.y(), to.x(), &distance, nullptr, nullptr);
    return distance;
}

MetersPerDegree meters_per_degree(double lon, double lat) {
    MetersPerDegree result{};

    const double lat_next = std::min(lat + 1.0, 90.0);
    result.lat = geodesic_distance(Point2D(lon, lat), Point2D(lon, lat_next));
    if (lat_next - lat < 1.0 && lat_next > lat) {
        result.lat /= (lat_next - lat);
    }
    if (!std::isfinite(result.lat) || result.lat <= 0.0) {
        result.lat = kMetersPerDegreeFallback;
    }

    result.lon = geodesic_distance(Point2D(lon, lat), Point2D(lon + 1.0, lat));
    if (!std::isfinite(result.lon) || result.lon <= 0.0) {
        const double radians = lat * kPi / 180.0;
        result.lon = kMetersPerDegreeFallback * std::max(0.1, std::cos(radians));
    }
    return result;
}

int utm_epsg_for(double lon, double lat) {
    int zone = static_cast<int>(std::floor((lon + 180.0) / 6.0)) + 1;
    zone = std::clamp(zone, 1, 60);
    return (lat >= 0.0 ? 32600 : 32700) + zone;
}

} // namespace hexmosaic
