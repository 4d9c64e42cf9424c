/**
 * @file ShapefileExporter.hpp
 * @brief ESRI Shapefile persistence for hex lattices, segments and mosaic layers
 *
 * Every output is written through GDAL/OGR as .shp + .shx + .dbf + .prj
 * (+ .cpg) so it opens directly in QGIS or ArcGIS.
 */

#pragma once

#include "hexmosaic.hpp"
#include "../core/FeatureSource.hpp"
#include "../core/Logger.hpp"
#include <optional>
#include <string>
#include <vector>

class OGRLayer;

namespace hexmosaic {

struct TessellationResult;
struct SamplingResult;
class ProjectPaths;

/**
 * @brief Writes feature layers as ESRI Shapefiles
 *
 * Existing files of the same name are removed with their sidecars before
 * writing. Failures are logged and reported through last_error().
 */
class ShapefileExporter {
public:
    struct Options {
        std::string encoding;
        bool create_spatial_index;

        Options()
            : encoding("UTF-8"),
              create_spatial_index(false) {}
    };

    ShapefileExporter();
    explicit ShapefileExporter(const Options& options);

    /**
     * @brief Write any layer with its fields and attributes
     * @param layer Layer to write
     * @param filename Output path; ".shp" is appended when missing
     * @return true if every feature was written
     */
    bool write_layer(const FeatureSource& layer, const std::string& filename);

    /**
     * @brief Write tiles, edges, vertices and centroids of a lattice
     *
     * Files go to Layers/Base/Base_Grid/{aoi}/ under the project root.
     */
    bool write_tessellation(const TessellationResult& result, const ProjectPaths& paths,
                            const std::string& aoi_name);

    /**
     * @brief Write a sampled hex layer
     *
     * Keeps every original attribute and appends elev_value, elev_bucket,
     * dem_source, bucket_method and generated_at.
     *
     * @param generated_at ISO-8601 UTC timestamp; the current time if empty
     * @return false with "No features to save." when nothing was sampled
     */
    bool write_hex_elevation_layer(const FeatureSource& hexes, const SamplingResult& sampling,
                                   const std::string& filename, const std::string& dem_source,
                                   const std::string& bucket_method,
                                   const std::optional<std::string>& generated_at = std::nullopt);

    /**
     * @brief In-memory form of the sampled hex layer written above
     */
    static MemoryFeatureSource build_hex_elevation_layer(const FeatureSource& hexes,
                                                         const SamplingResult& sampling,
                                                         const std::string& dem_source,
                                                         const std::string& bucket_method,
                                                         const std::string& generated_at);

    const std::string& last_error() const { return last_error_; }

private:
    bool fail(const std::string& message);
    bool create_fields(OGRLayer* layer, const std::vector<FieldDefinition>& fields);

    Options options_;
    std::string last_error_;
    Logger logger_;
};

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
std::string utc_timestamp();

} // namespace hexmosaic
