/**
 * @file ShapefileExporter.cpp
 * @brief Implementation of Shapefile export
 */

#include "ShapefileExporter.hpp"
#include "../core/ElevationSampler.hpp"
#include "../core/HexGridTessellator.hpp"
#include "../core/ProjectPaths.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <cpl_string.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <memory>
#include <type_traits>

namespace hexmosaic {

namespace {

struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

OGRwkbGeometryType layer_type(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::POINT: return wkbPoint;
        case GeometryKind::LINE: return wkbMultiLineString;
        case GeometryKind::POLYGON: return wkbMultiPolygon;
        default: return wkbUnknown;
    }
}

OGRFieldType ogr_field_type(FieldType type) {
    switch (type) {
        case FieldType::INTEGER: return OFTInteger64;
        case FieldType::REAL: return OFTReal;
        case FieldType::STRING: return OFTString;
    }
    return OFTString;
}

std::string truncate(const std::string& text, std::size_t width) {
    return text.size() > width ? text.substr(0, width) : text;
}

void set_ogr_field(OGRFeature* feature, int index, const FieldValue& value) {
    std::visit([feature, index](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            feature->SetFieldNull(index);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            feature->SetField(index, static_cast<GIntBig>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            feature->SetField(index, v);
        } else {
            feature->SetField(index, v.c_str());
        }
    }, value);
}

} // namespace

ShapefileExporter::ShapefileExporter()
    : options_(), logger_("ShapefileExporter") {
    GDALAllRegister();
}

ShapefileExporter::ShapefileExporter(const Options& options)
    : options_(options), logger_("ShapefileExporter") {
    GDALAllRegister();
}

bool ShapefileExporter::fail(const std::string& message) {
    last_error_ = message;
    logger_.error(message);
    return false;
}

bool ShapefileExporter::create_fields(OGRLayer* layer, const std::vector<FieldDefinition>& fields) {
    for (const auto& field : fields) {
        OGRFieldDefn definition(field.name.c_str(), ogr_field_type(field.type));
        if (field.width > 0) {
            definition.SetWidth(field.width);
        }
        if (field.precision > 0) {
            definition.SetPrecision(field.precision);
        }
        if (layer->CreateField(&definition) != OGRERR_NONE) {
            return fail("Failed to create field '" + field.name + "'");
        }
    }
    return true;
}

bool ShapefileExporter::write_layer(const FeatureSource& layer, const std::string& filename) {
    last_error_.clear();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("ESRI Shapefile");
    if (!driver) {
        return fail("Shapefile driver not available");
    }

    std::string shp_filename = filename;
    if (shp_filename.size() < 4 || shp_filename.substr(shp_filename.size() - 4) != ".shp") {
        shp_filename += ".shp";
    }

    const std::filesystem::path shp_path(shp_filename);
    std::error_code ec;
    if (shp_path.has_parent_path()) {
        std::filesystem::create_directories(shp_path.parent_path(), ec);
        if (ec) {
            return fail("Could not create directory " + shp_path.parent_path().string() + ": " + ec.message());
        }
    }
    remove_shapefile(shp_path);

    GDALDatasetPtr dataset(driver->Create(shp_filename.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        return fail("Failed to create Shapefile: " + shp_filename);
    }

    char** layer_options = nullptr;
    layer_options = CSLSetNameValue(layer_options, "ENCODING", options_.encoding.c_str());
    if (options_.create_spatial_index) {
        layer_options = CSLSetNameValue(layer_options, "SPATIAL_INDEX", "YES");
    }

    const OGRSpatialReference* srs = layer.crs().ogr();
    OGRLayer* ogr_layer = dataset->CreateLayer(shp_path.stem().string().c_str(),
                                               const_cast<OGRSpatialReference*>(srs),
                                               layer_type(layer.geometry_kind()), layer_options);
    CSLDestroy(layer_options);
    if (!ogr_layer) {
        return fail("Failed to create layer in " + shp_filename);
    }

    if (!create_fields(ogr_layer, layer.fields())) {
        return false;
    }

    const int field_count = static_cast<int>(layer.fields().size());
    std::size_t written = 0;
    for (const auto& feature : layer.features()) {
        OGRFeatureUniquePtr ogr_feature(OGRFeature::CreateFeature(ogr_layer->GetLayerDefn()));
        const Geometry shape = layer.geometry_kind() == GeometryKind::POINT
            ? feature.geometry : feature.geometry.to_multi();
        if (const OGRGeometry* geometry = shape.ogr()) {
            ogr_feature->SetGeometry(geometry);
        }
        for (int i = 0; i < field_count && i < static_cast<int>(feature.attributes.size()); ++i) {
            set_ogr_field(ogr_feature.get(), i, feature.attributes[static_cast<std::size_t>(i)]);
        }
        if (ogr_layer->CreateFeature(ogr_feature.get()) != OGRERR_NONE) {
            return fail("Failed to write feature " + std::to_string(feature.fid) + " to " + shp_filename);
        }
        ++written;
    }

    dataset.reset();
    logger_.detailed("Wrote " + std::to_string(written) + " features to " + shp_filename);
    return true;
}

bool ShapefileExporter::write_tessellation(const TessellationResult& result, const ProjectPaths& paths,
                                           const std::string& aoi_name) {
    if (result.empty()) {
        return fail("No hex cells to save for AOI '" + aoi_name + "'.");
    }

    MemoryFeatureSource tiles = make_hex_layer(result, "hex_tiles");

    MemoryFeatureSource edges("hex_edges", result.crs, GeometryKind::LINE);
    edges.add_field(FieldDefinition("id", FieldType::INTEGER, 10));
    for (const auto& edge : result.edges) {
        edges.add_feature(edge.geometry, {FieldValue(edge.id)}, edge.id);
    }

    MemoryFeatureSource vertices("hex_vertices", result.crs, GeometryKind::POINT);
    vertices.add_field(FieldDefinition("id", FieldType::INTEGER, 10));
    for (const auto& vertex : result.vertices) {
        vertices.add_feature(Geometry::point(vertex.position), {FieldValue(vertex.id)}, vertex.id);
    }

    MemoryFeatureSource centroids("hex_centroids", result.crs, GeometryKind::POINT);
    centroids.add_field(FieldDefinition("id", FieldType::INTEGER, 10));
    for (const auto& centroid : result.centroids) {
        centroids.add_feature(Geometry::point(centroid.position), {FieldValue(centroid.id)}, centroid.id);
    }

    return write_layer(tiles, paths.hex_tiles_file(aoi_name, result.cell_size_m).string()) &&
           write_layer(edges, paths.hex_edges_file(aoi_name).string()) &&
           write_layer(vertices, paths.hex_vertices_file(aoi_name).string()) &&
           write_layer(centroids, paths.hex_centroids_file(aoi_name).string());
}

MemoryFeatureSource ShapefileExporter::build_hex_elevation_layer(const FeatureSource& hexes,
                                                                 const SamplingResult& sampling,
                                                                 const std::string& dem_source,
                                                                 const std::string& bucket_method,
                                                                 const std::string& generated_at) {
    MemoryFeatureSource layer(hexes.name() + "_elevation", hexes.crs(), hexes.geometry_kind());
    for (const auto& field : hexes.fields()) {
        layer.add_field(field);
    }
    layer.add_field(FieldDefinition("elev_value", FieldType::REAL, 24, 15));
    layer.add_field(FieldDefinition("elev_bucket", FieldType::REAL, 24, 15));
    layer.add_field(FieldDefinition("dem_source", FieldType::STRING, 120));
    layer.add_field(FieldDefinition("bucket_method", FieldType::STRING, 32));
    layer.add_field(FieldDefinition("generated_at", FieldType::STRING, 32));

    const auto lookup = sampling.sample_by_feature();
    for (const auto& feature : hexes.features()) {
        std::vector<FieldValue> attributes = feature.attributes;
        attributes.resize(hexes.fields().size());

        auto it = lookup.find(feature.fid);
        if (it != lookup.end() && it->second.elev_value) {
            attributes.emplace_back(*it->second.elev_value);
        } else {
            attributes.emplace_back();
        }
        if (it != lookup.end() && it->second.elev_bucket) {
            attributes.emplace_back(*it->second.elev_bucket);
        } else {
            attributes.emplace_back();
        }
        attributes.emplace_back(truncate(dem_source, 120));
        attributes.emplace_back(truncate(bucket_method, 32));
        attributes.emplace_back(truncate(generated_at, 32));

        layer.add_feature(feature.geometry, std::move(attributes), feature.fid);
    }
    return layer;
}

bool ShapefileExporter::write_hex_elevation_layer(const FeatureSource& hexes, const SamplingResult& sampling,
                                                  const std::string& filename, const std::string& dem_source,
                                                  const std::string& bucket_method,
                                                  const std::optional<std::string>& generated_at) {
    if (sampling.total_features == 0 || hexes.feature_count() == 0) {
        return fail("No features to save.");
    }

    const std::string stamp = generated_at.value_or(utc_timestamp());
    MemoryFeatureSource layer = build_hex_elevation_layer(hexes, sampling, dem_source, bucket_method, stamp);
    if (!write_layer(layer, filename)) {
        return false;
    }
    logger_.info("Saved hex elevation layer to " + filename);
    return true;
}

std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace hexmosaic
