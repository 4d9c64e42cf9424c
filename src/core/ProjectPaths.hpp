#pragma once

/**
 * @file ProjectPaths.hpp
 * @brief On-disk layout of a HexMosaic project
 */

#include <filesystem>
#include <string>

namespace hexmosaic {

/**
 * @brief Replace every character that is not alphanumeric, '_', '-' or '.' with '_'
 */
std::string safe_filename(const std::string& name);

/**
 * @brief Lower-case safe name with spaces turned into underscores
 *
 * Used as the key for per-AOI project metadata.
 */
std::string slug(const std::string& name);

/**
 * @brief Resolves where each derived layer lives below the project root
 *
 * Directories are not created here; writers create what they need.
 */
class ProjectPaths {
public:
    explicit ProjectPaths(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path layers_dir() const;
    std::filesystem::path project_settings_file() const;

    /// Layers/Base/Base_Grid/{safe aoi}
    std::filesystem::path base_grid_dir(const std::string& aoi_name) const;

    std::filesystem::path hex_tiles_file(const std::string& aoi_name, double cell_size_m) const;
    std::filesystem::path hex_edges_file(const std::string& aoi_name) const;
    std::filesystem::path hex_vertices_file(const std::string& aoi_name) const;
    std::filesystem::path hex_centroids_file(const std::string& aoi_name) const;

    std::filesystem::path segments_dir(const std::string& aoi_name) const;

    std::filesystem::path elevation_hex_file(const std::string& base_name) const;

    std::filesystem::path mosaic_dir() const;
    std::filesystem::path mosaic_file(const std::string& layer_name) const;

private:
    std::filesystem::path root_;
};

/**
 * @brief Delete a shapefile and its sidecars (.shx .dbf .prj .cpg .qix .qmd)
 */
void remove_shapefile(const std::filesystem::path& shp_path);

} // namespace hexmosaic
