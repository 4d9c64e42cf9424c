/**
 * @file ProjectPaths.cpp
 * @brief Project directory layout helpers
 */

#include "ProjectPaths.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace hexmosaic {

namespace {

std::string underscored(const std::string& name) {
    std::string result = name;
    std::replace(result.begin(), result.end(), ' ', '_');
    return result;
}

} // namespace

std::string safe_filename(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '_' || c == '-' || c == '.') {
            result += static_cast<char>(c);
        } else {
            result += '_';
        }
    }
    return result;
}

std::string slug(const std::string& name) {
    std::string result = safe_filename(underscored(name));
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

ProjectPaths::ProjectPaths(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path ProjectPaths::layers_dir() const {
    return root_ / "Layers";
}

std::filesystem::path ProjectPaths::project_settings_file() const {
    return root_ / "hexmosaic.project.json";
}

std::filesystem::path ProjectPaths::base_grid_dir(const std::string& aoi_name) const {
    return layers_dir() / "Base" / "Base_Grid" / safe_filename(underscored(aoi_name));
}

std::filesystem::path ProjectPaths::hex_tiles_file(const std::string& aoi_name, double cell_size_m) const {
    const long long size = std::llround(cell_size_m);
    return base_grid_dir(aoi_name) / ("hex_tiles_" + std::to_string(size) + "m.shp");
}

std::filesystem::path ProjectPaths::hex_edges_file(const std::string& aoi_name) const {
    return base_grid_dir(aoi_name) / "hex_edges.shp";
}

std::filesystem::path ProjectPaths::hex_vertices_file(const std::string& aoi_name) const {
    return base_grid_dir(aoi_name) / "hex_vertices.shp";
}

std::filesystem::path ProjectPaths::hex_centroids_file(const std::string& aoi_name) const {
    return base_grid_dir(aoi_name) / "hex_centroids.shp";
}

std::filesystem::path ProjectPaths::segments_dir(const std::string& aoi_name) const {
    return base_grid_dir(aoi_name) / "Segments";
}

std::filesystem::path ProjectPaths::elevation_hex_file(const std::string& base_name) const {
    return layers_dir() / "Elevation" / "HexPalette" /
           (safe_filename(underscored(base_name)) + "_hex_elevation.shp");
}

std::filesystem::path ProjectPaths::mosaic_dir() const {
    return layers_dir() / "Mosaic";
}

std::filesystem::path ProjectPaths::mosaic_file(const std::string& layer_name) const {
    return mosaic_dir() / (safe_filename(underscored(layer_name)) + ".shp");
}

void remove_shapefile(const std::filesystem::path& shp_path) {
    static const std::array<const char*, 7> extensions = {
        ".shp", ".shx", ".dbf", ".prj", ".cpg", ".qix", ".qmd"};
    std::error_code ec;
    for (const char* ext : extensions) {
        std::filesystem::path sidecar = shp_path;
        sidecar.replace_extension(ext);
        // Missing sidecars are expected
        std::filesystem::remove(sidecar, ec);
    }
}

} // namespace hexmosaic
