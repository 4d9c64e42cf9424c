/**
 * @file MosaicBuilder.hpp
 * @brief Builds and saves one mosaic layer per palette class
 */

#pragma once

#include "hexmosaic.hpp"
#include "ShapefileExporter.hpp"
#include "../core/FeatureClassifier.hpp"
#include "../core/FeatureSource.hpp"
#include "../core/HexIndex.hpp"
#include "../core/LineTracer.hpp"
#include "../core/Logger.hpp"
#include "../core/MosaicProfile.hpp"
#include "../core/ProjectPaths.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief A saved mosaic layer
 */
struct MosaicOutput {
    std::string class_id;
    std::string layer_name;
    std::filesystem::path path;
    std::size_t feature_count = 0;
};

/**
 * @brief Runs palette classes against one hex layer
 *
 * The hex index and the shared-edge cache are built once per builder and
 * reused for every class. The hex layer must outlive the builder.
 */
class MosaicBuilder {
public:
    MosaicBuilder(const FeatureSource& hexes, ProjectPaths paths);

    /**
     * @brief Hex cells selected by a polygon class
     *
     * Output features keep the hex attributes and add class_id, coverage
     * and source_layers.
     *
     * @return nullopt when no cell is selected
     */
    std::optional<MemoryFeatureSource> build_polygon_class(const MosaicClass& cls,
                                                           const std::vector<const FeatureSource*>& sources,
                                                           const MosaicClassState& state);

    /**
     * @brief Traced lattice paths of a line class, one feature per line part
     * @return nullopt when no path is produced
     */
    std::optional<MemoryFeatureSource> build_line_class(const MosaicClass& cls,
                                                        const std::vector<const FeatureSource*>& sources,
                                                        const MosaicClassState& state);

    /**
     * @brief Build a class and save it under Layers/Mosaic
     */
    std::optional<MosaicOutput> run_class(const MosaicClass& cls,
                                          const std::vector<const FeatureSource*>& sources,
                                          const MosaicClassState& state);

    /// "{hex layer name up to '('}_{target layer}"
    static std::string output_name(const std::string& hex_layer_name, const std::string& target_layer);

    const HexIndex& index() const { return index_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    static std::string joined_source_names(const std::vector<const FeatureSource*>& sources);

    const FeatureSource& hexes_;
    ProjectPaths paths_;
    HexIndex index_;
    LineTracer tracer_;
    FeatureClassifier classifier_;
    ShapefileExporter exporter_;
    std::vector<std::string> warnings_;
    Logger logger_;
};

} // namespace hexmosaic
