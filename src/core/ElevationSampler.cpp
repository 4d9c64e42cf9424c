/**
 * @file ElevationSampler.cpp
 * @brief Hex elevation sampling on top of the zonal statistics engine
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ElevationSampler.hpp"
#include "Errors.hpp"
#include "SpatialReference.hpp"
#include "ZonalStatistics.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace hexmosaic {

namespace {

constexpr double kBucketSnapTolerance = 1e-6;

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Shortest form, as printf("%g")
std::string format_number(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace

std::map<std::int64_t, ElevationSample> SamplingResult::sample_by_feature() const {
    std::map<std::int64_t, ElevationSample> lookup;
    for (const auto& sample : samples) {
        lookup[sample.feature_id] = sample;
    }
    return lookup;
}

double bucket_value(double value, double bucket_size) {
    if (!(bucket_size > 0.0)) {
        throw InvalidArgument("Bucket size must be greater than zero.");
    }
    const double bucket = std::floor(value / bucket_size) * bucket_size;
    const double rounded = std::round(bucket);
    if (std::abs(bucket - rounded) <= kBucketSnapTolerance) {
        return rounded == 0.0 ? 0.0 : rounded;
    }
    return bucket;
}

SamplingMethod parse_sampling_method(const std::string& text) {
    const std::string key = lower(text.empty() ? std::string("mean") : text);
    if (key == "mean") return SamplingMethod::MEAN;
    if (key == "median") return SamplingMethod::MEDIAN;
    if (key == "min") return SamplingMethod::MIN;
    throw InvalidArgument("Unsupported sampling method: " + text);
}

std::string to_string(SamplingMethod method) {
    switch (method) {
        case SamplingMethod::MEAN: return "mean";
        case SamplingMethod::MEDIAN: return "median";
        case SamplingMethod::MIN: return "min";
    }
    return "mean";
}

std::string format_sampling_summary(const SamplingResult& result) {
    if (result.count_with_data == 0) {
        return "0/" + std::to_string(result.total_features) + " hexes sampled";
    }

    std::string bucket_part;
    if (result.min_bucket && result.max_bucket) {
        if (std::abs(*result.min_bucket - *result.max_bucket) <= kBucketSnapTolerance) {
            bucket_part = ", bucket " + format_number(*result.min_bucket);
        } else {
            bucket_part = ", bucket " + format_number(*result.min_bucket) + "–" +
                          format_number(*result.max_bucket);
        }
    }
    return std::to_string(result.count_with_data) + "/" + std::to_string(result.total_features) +
           " hexes sampled" + bucket_part;
}

// ============================================================================
// ElevationSampler
// ============================================================================

ElevationSampler::ElevationSampler(std::string prefix)
    : prefix_(std::move(prefix)), logger_("ElevationSampler") {}

MemoryFeatureSource ElevationSampler::copy_hex_features(const FeatureSource& hexes, const Crs& raster_crs,
                                                       std::vector<std::string>& warnings) const {
    MemoryFeatureSource copy("hex_temp", raster_crs, GeometryKind::POLYGON);
    copy.add_field(FieldDefinition("src_fid", FieldType::INTEGER, 18));

    std::optional<CoordinateTransformer> transform;
    if (!hexes.crs().same_as(raster_crs)) {
        transform.emplace(hexes.crs(), raster_crs);
        logger_.debug("Reprojecting hexes from " + hexes.crs().auth_id() + " to " + raster_crs.auth_id());
    }

    for (const auto& feature : hexes.features()) {
        Geometry geometry = feature.geometry;
        if (transform) {
            try {
                geometry = transform->transform_geometry(feature.geometry);
            } catch (const InvalidArgument& e) {
                warnings.push_back("Hex feature " + std::to_string(feature.fid) + " could not be reprojected: " +
                                   e.what());
                logger_.warning(warnings.back());
                geometry = Geometry();
            }
        }
        copy.add_feature(geometry, {FieldValue(feature.fid)}, feature.fid);
    }
    return copy;
}

SamplingResult ElevationSampler::sample(const RasterSource& dem, const FeatureSource& hexes,
                                        const std::string& method, double bucket_size) const {
    return sample(dem, hexes, parse_sampling_method(method), bucket_size);
}

SamplingResult ElevationSampler::sample(const RasterSource& dem, const FeatureSource& hexes,
                                        SamplingMethod method, double bucket_size) const {
    if (!dem.is_valid()) {
        throw InvalidArgument("Raster layer is invalid.");
    }
    if (!hexes.is_valid()) {
        throw InvalidArgument("Hex layer is invalid.");
    }
    if (hexes.geometry_kind() != GeometryKind::POLYGON) {
        throw InvalidArgument("Hex layer must contain polygonal features.");
    }
    if (!(bucket_size > 0.0)) {
        throw InvalidArgument("Bucket size must be greater than zero.");
    }

    logger_.detailed("Sampling " + std::to_string(hexes.feature_count()) + " hexes from " + dem.name() +
                     " (" + to_string(method) + ", bucket " + format_number(bucket_size) + ")");

    SamplingResult result;
    result.method = method;
    result.bucket_size = bucket_size;

    MemoryFeatureSource working = copy_hex_features(hexes, dem.crs(), result.warnings);

    unsigned statistic = ZONAL_MEAN;
    std::string suffix = "mean";
    if (method == SamplingMethod::MEDIAN) {
        statistic = ZONAL_MEDIAN;
        suffix = "median";
    } else if (method == SamplingMethod::MIN) {
        statistic = ZONAL_MIN;
        suffix = "min";
    }

    ZonalStatistics zonal(working, dem, prefix_, statistic | ZONAL_COUNT);
    const ZonalStatus status = zonal.calculate();
    if (status != ZonalStatus::SUCCESS) {
        throw SamplingEngineError("Zonal statistics failed for the supplied layers (status " +
                                  std::to_string(static_cast<int>(status)) + "): " + zonal.last_error());
    }

    const auto value_index = working.field_index(prefix_ + suffix);
    if (!value_index) {
        throw SamplingEngineError("Statistic field '" + prefix_ + suffix + "' not found.");
    }
    const auto count_index = working.field_index(prefix_ + "count");
    const auto fid_index = working.field_index("src_fid");

    for (const auto& feature : working.features()) {
        std::int64_t src_fid = feature.fid;
        if (fid_index) {
            src_fid = field_as_int(feature.attributes[*fid_index]).value_or(feature.fid);
        }

        std::int64_t count = 0;
        if (count_index) {
            count = field_as_int(feature.attributes[*count_index]).value_or(0);
        }

        ElevationSample sample;
        sample.feature_id = src_fid;
        sample.pixel_count = count;

        const auto raw = field_as_double(feature.attributes[*value_index]);
        if (!raw || std::isnan(*raw) || count <= 0) {
            if (count <= 0) {
                result.warnings.push_back("Hex feature " + std::to_string(src_fid) + " has no raster coverage.");
                logger_.warning(result.warnings.back());
            }
            result.samples.push_back(sample);
            continue;
        }

        sample.elev_value = *raw;
        sample.elev_bucket = bucket_value(*raw, bucket_size);
        result.samples.push_back(sample);
        ++result.count_with_data;

        result.min_value = result.min_value ? std::min(*result.min_value, *raw) : *raw;
        result.max_value = result.max_value ? std::max(*result.max_value, *raw) : *raw;
        result.min_bucket = result.min_bucket ? std::min(*result.min_bucket, *sample.elev_bucket) : *sample.elev_bucket;
        result.max_bucket = result.max_bucket ? std::max(*result.max_bucket, *sample.elev_bucket) : *sample.elev_bucket;
    }
    result.total_features = result.samples.size();

    logger_.info(format_sampling_summary(result));
    return result;
}

} // namespace hexmosaic
