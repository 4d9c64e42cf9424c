#pragma once

/**
 * @file FeatureClassifier.hpp
 * @brief Assigns polygon features to the hex cells they cover
 */

#include "hexmosaic.hpp"
#include "Geometry.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace hexmosaic {

class FeatureSource;
class HexIndex;

/**
 * @brief Cells selected by one polygon class
 *
 * coverage maps a cell id to the covered fraction of its area in [0, 1],
 * rounded to 4 decimals.
 */
struct ClassificationResult {
    std::map<std::int64_t, double> coverage;
    std::vector<std::string> warnings;

    bool empty() const { return coverage.empty(); }
};

/**
 * @brief Polygon-in-hex classification
 *
 * A cell is selected when the source polygons contain its centroid or
 * overlap it at all. A positive threshold additionally drops cells whose
 * centroid is uncovered and whose coverage is below the threshold.
 */
class FeatureClassifier {
public:
    FeatureClassifier();

    /**
     * @brief Classify the cells of an index against polygon sources
     *
     * Sources in another CRS are reprojected into the index CRS. Invalid
     * layers, failed transforms and unrepairable features are skipped with
     * a warning.
     */
    ClassificationResult classify_polygons(const HexIndex& index,
                                           const std::vector<const FeatureSource*>& sources,
                                           double threshold = 0.0) const;

    /**
     * @brief Repaired polygon geometries of the sources in the index CRS
     */
    std::vector<Geometry> collect_polygons(const HexIndex& index,
                                           const std::vector<const FeatureSource*>& sources,
                                           std::vector<std::string>& warnings) const;

    const Logger& get_logger() const { return logger_; }

private:
    Logger logger_;
};

/// Shorthand for FeatureClassifier().classify_polygons()
ClassificationResult classify_polygons(const HexIndex& index,
                                       const std::vector<const FeatureSource*>& sources,
                                       double threshold = 0.0);

} // namespace hexmosaic
