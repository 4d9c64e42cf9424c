/**
 * @file ZonalStatistics.cpp
 * @brief Scanline pixel-centre zonal statistics with a precise fallback for small polygons
 */

#include "ZonalStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace hexmosaic {

struct ZonalStatistics::FeatureStats {
    std::vector<double> values;
    std::vector<double> weights;

    std::int64_t count() const { return static_cast<std::int64_t>(values.size()); }

    double mean() const {
        double sum = 0.0;
        double weight_sum = 0.0;
        for (size_t i = 0; i < values.size(); ++i) {
            const double w = weights.empty() ? 1.0 : weights[i];
            sum += values[i] * w;
            weight_sum += w;
        }
        return weight_sum > 0.0 ? sum / weight_sum : std::numeric_limits<double>::quiet_NaN();
    }

    double median() const {
        if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
        std::vector<double> sorted = values;
        std::sort(sorted.begin(), sorted.end());
        const size_t mid = sorted.size() / 2;
        if (sorted.size() % 2 == 0) {
            return (sorted[mid - 1] + sorted[mid]) / 2.0;
        }
        return sorted[mid];
    }

    double min() const {
        if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
        return *std::min_element(values.begin(), values.end());
    }
};

ZonalStatistics::ZonalStatistics(MemoryFeatureSource& polygons, const RasterSource& raster,
                                 std::string prefix, unsigned statistics)
    : polygons_(polygons), raster_(raster), prefix_(std::move(prefix)),
      statistics_(statistics | ZONAL_COUNT), logger_("ZonalStatistics") {}

bool ZonalStatistics::is_no_data(double value) const {
    if (std::isnan(value)) {
        return true;
    }
    auto no_data = raster_.no_data();
    return no_data && value == *no_data;
}

ZonalStatus ZonalStatistics::calculate() {
    if (!raster_.is_valid()) {
        last_error_ = "Raster is invalid";
        return ZonalStatus::INVALID_RASTER;
    }
    if (!polygons_.is_valid() || polygons_.geometry_kind() != GeometryKind::POLYGON) {
        last_error_ = "Layer is not a valid polygon layer";
        return ZonalStatus::INVALID_LAYER;
    }
    if (!polygons_.crs().same_as(raster_.crs())) {
        last_error_ = "Layer and raster use different coordinate reference systems";
        return ZonalStatus::CRS_MISMATCH;
    }

    gt_ = raster_.geo_transform();
    if (gt_[2] != 0.0 || gt_[4] != 0.0 || gt_[1] <= 0.0 || gt_[5] >= 0.0) {
        last_error_ = "Only north-up rasters are supported";
        return ZonalStatus::ROTATED_RASTER;
    }

    const std::size_t count_field = polygons_.add_field(FieldDefinition(prefix_ + "count", FieldType::INTEGER, 10));
    auto optional_field = [this](unsigned flag, const std::string& suffix) -> std::optional<std::size_t> {
        if (!(statistics_ & flag)) return std::nullopt;
        return polygons_.add_field(FieldDefinition(prefix_ + suffix, FieldType::REAL, 24, 15));
    };
    const auto mean_field = optional_field(ZONAL_MEAN, "mean");
    const auto median_field = optional_field(ZONAL_MEDIAN, "median");
    const auto min_field = optional_field(ZONAL_MIN, "min");

    const int width = raster_.width();
    const int height = raster_.height();
    const double pixel_w = gt_[1];
    const double pixel_h = -gt_[5];

    std::vector<double> block;
    for (std::size_t i = 0; i < polygons_.features().size(); ++i) {
        const Geometry& polygon = polygons_.features()[i].geometry;
        FeatureStats stats;

        if (!polygon.is_empty() && polygon.is_polygonal()) {
            const BoundingBox env = polygon.envelope();
            // Clamp before the cast; offsets far outside the raster overflow int
            auto pixel_index = [](double offset, int size) {
                return static_cast<int>(std::clamp(std::floor(offset), -1.0, static_cast<double>(size)));
            };
            const int col0 = std::max(0, pixel_index((env.min_x - gt_[0]) / pixel_w, width));
            const int col1 = std::min(width - 1, pixel_index((env.max_x - gt_[0]) / pixel_w, width));
            const int row0 = std::max(0, pixel_index((gt_[3] - env.max_y) / pixel_h, height));
            const int row1 = std::min(height - 1, pixel_index((gt_[3] - env.min_y) / pixel_h, height));

            if (col0 <= col1 && row0 <= row1) {
                const int cols = col1 - col0 + 1;
                const int rows = row1 - row0 + 1;
                if (!raster_.read_block(col0, row0, cols, rows, block)) {
                    last_error_ = "Could not read raster window for feature " +
                                  std::to_string(polygons_.features()[i].fid);
                    return ZonalStatus::READ_FAILED;
                }
                collect_by_centre(polygon, col0, row0, cols, rows, block, stats);
                if (stats.count() <= 1) {
                    // Polygon smaller than the pixels around it
                    stats = FeatureStats();
                    collect_precise(polygon, col0, row0, cols, rows, block, stats);
                }
            }
        }

        polygons_.set_attribute(i, count_field, FieldValue(stats.count()));
        auto store = [&](const std::optional<std::size_t>& field, double value) {
            if (!field) return;
            polygons_.set_attribute(i, *field, std::isnan(value) ? FieldValue() : FieldValue(value));
        };
        store(mean_field, stats.mean());
        store(median_field, stats.median());
        store(min_field, stats.min());
    }

    logger_.detailed("Zonal statistics computed for " + std::to_string(polygons_.features().size()) + " polygons");
    return ZonalStatus::SUCCESS;
}

void ZonalStatistics::collect_by_centre(const Geometry& polygon, int col0, int row0, int cols, int rows,
                                        const std::vector<double>& block, FeatureStats& stats) const {
    const auto rings = polygon.rings();
    std::vector<double> crossings;

    for (int r = 0; r < rows; ++r) {
        const double y = gt_[3] + (row0 + r + 0.5) * gt_[5];

        crossings.clear();
        for (const auto& ring : rings) {
            for (size_t k = 0; k + 1 < ring.size(); ++k) {
                const Point2D& a = ring[k];
                const Point2D& b = ring[k + 1];
                if ((a.y() > y) != (b.y() > y)) {
                    crossings.push_back(a.x() + (y - a.y()) * (b.x() - a.x()) / (b.y() - a.y()));
                }
            }
        }
        if (crossings.size() < 2) {
            continue;
        }
        std::sort(crossings.begin(), crossings.end());

        for (size_t k = 0; k + 1 < crossings.size(); k += 2) {
            // Columns whose centres fall in [x_enter, x_exit)
            const int first = static_cast<int>(std::ceil((crossings[k] - gt_[0]) / gt_[1] - 0.5));
            const int last = static_cast<int>(std::ceil((crossings[k + 1] - gt_[0]) / gt_[1] - 0.5)) - 1;
            for (int c = std::max(first, col0); c <= std::min(last, col0 + cols - 1); ++c) {
                const double value = block[static_cast<size_t>(r) * cols + (c - col0)];
                if (!is_no_data(value)) {
                    stats.values.push_back(value);
                }
            }
        }
    }
}

void ZonalStatistics::collect_precise(const Geometry& polygon, int col0, int row0, int cols, int rows,
                                      const std::vector<double>& block, FeatureStats& stats) const {
    const double pixel_area = std::abs(gt_[1] * gt_[5]);
    for (int r = 0; r < rows; ++r) {
        const double top = gt_[3] + (row0 + r) * gt_[5];
        const double bottom = top + gt_[5];
        for (int c = 0; c < cols; ++c) {
            const double value = block[static_cast<size_t>(r) * cols + c];
            if (is_no_data(value)) {
                continue;
            }
            const double left = gt_[0] + (col0 + c) * gt_[1];
            Geometry pixel = Geometry::rectangle(BoundingBox(left, bottom, left + gt_[1], top));
            const double overlap = pixel.intersection(polygon).area();
            if (overlap > 0.0) {
                stats.values.push_back(value);
                stats.weights.push_back(overlap / pixel_area);
            }
        }
    }
}

} // namespace hexmosaic
