#pragma once

/**
 * @file ElevationSampler.hpp
 * @brief Per-hex elevation sampling and bucket quantisation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "hexmosaic.hpp"
#include "FeatureSource.hpp"
#include "RasterSource.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief Sampled elevation of one hex
 *
 * elev_value is empty exactly when pixel_count is 0 or the statistic was NaN.
 */
struct ElevationSample {
    std::int64_t feature_id = 0;
    std::optional<double> elev_value;
    std::optional<double> elev_bucket;
    std::int64_t pixel_count = 0;
};

/**
 * @brief All samples of one run plus summary figures
 */
struct SamplingResult {
    std::vector<ElevationSample> samples;
    SamplingMethod method = SamplingMethod::MEAN;
    double bucket_size = 1.0;
    std::size_t total_features = 0;
    std::size_t count_with_data = 0;
    std::optional<double> min_value;
    std::optional<double> max_value;
    std::optional<double> min_bucket;
    std::optional<double> max_bucket;
    std::vector<std::string> warnings;

    /// Samples keyed by hex feature id
    std::map<std::int64_t, ElevationSample> sample_by_feature() const;
};

/**
 * @brief Floor a value to a multiple of the bucket size
 *
 * Results within 1e-6 of an integer are snapped to it.
 *
 * @throws InvalidArgument if bucket_size is not positive
 */
double bucket_value(double value, double bucket_size);

/// @throws InvalidArgument("Unsupported sampling method: ...")
SamplingMethod parse_sampling_method(const std::string& text);
std::string to_string(SamplingMethod method);

/**
 * @brief One-line summary: "12/14 hexes sampled, bucket 20–140"
 */
std::string format_sampling_summary(const SamplingResult& result);

/**
 * @brief Samples a DEM under every hex of a polygon layer
 */
class ElevationSampler {
public:
    /// @param prefix Prefix of the temporary statistic fields
    explicit ElevationSampler(std::string prefix = "hm_");

    /**
     * @brief Zonal statistics of the DEM per hex, bucketed
     *
     * Hex geometries are reprojected into the raster CRS; the raster is
     * never resampled.
     *
     * @throws InvalidArgument for an invalid raster or hex layer, a
     *         non-polygonal hex layer or a non-positive bucket size
     * @throws SamplingEngineError if the statistics engine fails
     */
    SamplingResult sample(const RasterSource& dem, const FeatureSource& hexes,
                          SamplingMethod method, double bucket_size) const;

    /**
     * @brief Same as sample() with the method given by name
     * @throws InvalidArgument for an unknown method name
     */
    SamplingResult sample(const RasterSource& dem, const FeatureSource& hexes,
                          const std::string& method, double bucket_size) const;

private:
    /// Copy of the hexes in the raster CRS carrying only src_fid.
    /// A hex that cannot be reprojected is kept with an empty geometry.
    MemoryFeatureSource copy_hex_features(const FeatureSource& hexes, const Crs& raster_crs,
                                          std::vector<std::string>& warnings) const;

    std::string prefix_;
    Logger logger_;
};

} // namespace hexmosaic
