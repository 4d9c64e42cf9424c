#pragma once

/**
 * @file ZonalStatistics.hpp
 * @brief Per-polygon raster statistics written back as attributes
 */

#include "FeatureSource.hpp"
#include "RasterSource.hpp"
#include "Logger.hpp"
#include <string>

namespace hexmosaic {

/**
 * @brief Statistics that can be requested; combine with |
 */
enum ZonalStatistic : unsigned {
    ZONAL_COUNT = 1u << 0,
    ZONAL_MEAN = 1u << 1,
    ZONAL_MEDIAN = 1u << 2,
    ZONAL_MIN = 1u << 3
};

/**
 * @brief Outcome of ZonalStatistics::calculate(); anything but SUCCESS is a failure
 */
enum class ZonalStatus {
    SUCCESS = 0,
    INVALID_RASTER = 1,
    INVALID_LAYER = 2,
    CRS_MISMATCH = 3,
    ROTATED_RASTER = 4,
    READ_FAILED = 5
};

/**
 * @brief Zonal statistics over a polygon layer and band 1 of a raster
 *
 * A pixel belongs to a polygon when its centre is inside it (even-odd
 * rule over all rings). Nodata and NaN pixels are ignored. When at most
 * one pixel centre falls inside a polygon, the pixels are instead
 * intersected exactly with the polygon: the mean is weighted by the
 * overlapping area, the count is the number of overlapping pixels.
 *
 * Results are added to the layer as `{prefix}count`, `{prefix}mean`,
 * `{prefix}median` and `{prefix}min`. A polygon without data gets count 0
 * and NULL statistics.
 */
class ZonalStatistics {
public:
    /**
     * @param polygons Layer to annotate, in the raster CRS
     * @param raster Source raster; must be north-up
     * @param prefix Prefix of the output field names
     * @param statistics Bitmask of ZonalStatistic values
     */
    ZonalStatistics(MemoryFeatureSource& polygons, const RasterSource& raster,
                    std::string prefix, unsigned statistics);

    ZonalStatus calculate();

    const std::string& last_error() const { return last_error_; }

private:
    struct FeatureStats;

    void collect_by_centre(const Geometry& polygon, int col0, int row0, int cols, int rows,
                           const std::vector<double>& block, FeatureStats& stats) const;
    void collect_precise(const Geometry& polygon, int col0, int row0, int cols, int rows,
                         const std::vector<double>& block, FeatureStats& stats) const;
    bool is_no_data(double value) const;

    MemoryFeatureSource& polygons_;
    const RasterSource& raster_;
    std::string prefix_;
    unsigned statistics_;
    std::array<double, 6> gt_{};
    std::string last_error_;
    Logger logger_;
};

} // namespace hexmosaic
