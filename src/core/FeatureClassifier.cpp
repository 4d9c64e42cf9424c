/**
 * @file FeatureClassifier.cpp
 * @brief Polygon coverage of hex cells
 */

#include "FeatureClassifier.hpp"
#include "Errors.hpp"
#include "FeatureSource.hpp"
#include "HexIndex.hpp"
#include "SpatialReference.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace hexmosaic {

namespace {

double round_coverage(double ratio) {
    return std::round(ratio * 10000.0) / 10000.0;
}

} // namespace

FeatureClassifier::FeatureClassifier() : logger_("FeatureClassifier") {}

std::vector<Geometry> FeatureClassifier::collect_polygons(const HexIndex& index,
                                                          const std::vector<const FeatureSource*>& sources,
                                                          std::vector<std::string>& warnings) const {
    std::vector<Geometry> polygons;

    for (const FeatureSource* source : sources) {
        if (!source || !source->is_valid()) {
            warnings.push_back("Polygon source '" + (source ? source->name() : std::string()) +
                               "' is invalid; skipped.");
            logger_.warning(warnings.back());
            continue;
        }
        if (source->geometry_kind() != GeometryKind::POLYGON) {
            warnings.push_back("Polygon source '" + source->name() + "' has no polygonal features; skipped.");
            logger_.warning(warnings.back());
            continue;
        }

        std::optional<CoordinateTransformer> transform;
        if (!source->crs().same_as(index.crs())) {
            try {
                transform.emplace(source->crs(), index.crs());
            } catch (const InvalidArgument& e) {
                warnings.push_back("Polygon source '" + source->name() + "' skipped: " + e.what());
                logger_.warning(warnings.back());
                continue;
            }
        }

        for (const auto& feature : source->features()) {
            if (feature.geometry.is_empty()) {
                continue;
            }
            Geometry geometry = feature.geometry;
            if (transform) {
                try {
                    geometry = transform->transform_geometry(geometry);
                } catch (const InvalidArgument& e) {
                    warnings.push_back("Feature " + std::to_string(feature.fid) + " of '" + source->name() +
                                       "' skipped: " + e.what());
                    logger_.warning(warnings.back());
                    continue;
                }
            }
            RepairResult repaired = geometry.make_valid();
            if (!repaired.ok()) {
                warnings.push_back("Feature " + std::to_string(feature.fid) + " of '" + source->name() +
                                   "' skipped: " + repaired.error);
                logger_.warning(warnings.back());
                continue;
            }
            Geometry polygonal = repaired.geometry.polygonal_part();
            if (!polygonal.is_empty()) {
                polygons.push_back(polygonal);
            }
        }
    }
    return polygons;
}

ClassificationResult FeatureClassifier::classify_polygons(const HexIndex& index,
                                                          const std::vector<const FeatureSource*>& sources,
                                                          double threshold) const {
    ClassificationResult result;
    if (index.size() == 0) {
        result.warnings.push_back("Hex layer has no cells to classify.");
        logger_.warning(result.warnings.back());
        return result;
    }

    const std::vector<Geometry> polygons = collect_polygons(index, sources, result.warnings);
    const Geometry coverage_area = Geometry::unary_union(polygons);
    if (coverage_area.is_empty()) {
        logger_.detailed("No source polygons to classify against");
        return result;
    }

    const auto candidates = index.candidates(coverage_area.envelope());
    logger_.debug(std::to_string(candidates.size()) + " candidate hexes for " +
                  std::to_string(polygons.size()) + " source polygons");

    for (std::int64_t id : candidates) {
        const IndexedHex* hex = index.find(id);
        if (!hex || hex->area <= 0.0) {
            continue;
        }

        const bool centroid_hit = coverage_area.intersects(Geometry::point(hex->centroid));
        const double overlap = hex->geometry.intersection(coverage_area).area();
        if (!centroid_hit && overlap <= 0.0) {
            continue;
        }

        const double ratio = std::min(1.0, overlap / hex->area);
        if (threshold > 0.0 && !centroid_hit && ratio < threshold) {
            continue;
        }
        result.coverage[id] = round_coverage(ratio);
    }

    logger_.detailed("Classified " + std::to_string(result.coverage.size()) + " of " +
                     std::to_string(index.size()) + " hexes");
    return result;
}

ClassificationResult classify_polygons(const HexIndex& index,
                                       const std::vector<const FeatureSource*>& sources,
                                       double threshold) {
    return FeatureClassifier().classify_polygons(index, sources, threshold);
}

} // namespace hexmosaic
