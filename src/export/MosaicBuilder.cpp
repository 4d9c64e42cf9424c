/**
 * @file MosaicBuilder.cpp
 * @brief Implementation of mosaic class generation
 */

#include "MosaicBuilder.hpp"
#include "../core/Errors.hpp"
#include "../core/SpatialReference.hpp"
#include <algorithm>

namespace hexmosaic {

namespace {

std::string trim(const std::string& text, const char* characters) {
    const auto first = text.find_first_not_of(characters);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(characters);
    return text.substr(first, last - first + 1);
}

} // namespace

MosaicBuilder::MosaicBuilder(const FeatureSource& hexes, ProjectPaths paths)
    : hexes_(hexes),
      paths_(std::move(paths)),
      index_(hexes),
      tracer_(index_),
      logger_("MosaicBuilder") {
    warnings_ = index_.warnings();
}

std::string MosaicBuilder::output_name(const std::string& hex_layer_name, const std::string& target_layer) {
    const std::string base_label = trim(hex_layer_name.substr(0, hex_layer_name.find('(')), " \t\r\n");
    return trim(base_label + "_" + target_layer, "_");
}

std::string MosaicBuilder::joined_source_names(const std::vector<const FeatureSource*>& sources) {
    std::vector<std::string> names;
    for (const FeatureSource* source : sources) {
        if (source) {
            names.push_back(source->name());
        }
    }
    std::sort(names.begin(), names.end());
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) joined += ";";
        joined += names[i];
    }
    return joined;
}

std::optional<MemoryFeatureSource> MosaicBuilder::build_polygon_class(const MosaicClass& cls,
                                                                      const std::vector<const FeatureSource*>& sources,
                                                                      const MosaicClassState& state) {
    if (sources.empty()) {
        logger_.info("Mosaic: class '" + cls.class_id + "' skipped (no polygon sources selected).");
        return std::nullopt;
    }

    ClassificationResult classes = classifier_.classify_polygons(index_, sources, state.area_threshold);
    warnings_.insert(warnings_.end(), classes.warnings.begin(), classes.warnings.end());
    if (classes.empty()) {
        logger_.info("Mosaic: class '" + cls.class_id + "' -> no tiles intersect selected sources.");
        return std::nullopt;
    }

    MemoryFeatureSource layer(cls.target_layer, hexes_.crs(), GeometryKind::POLYGON);
    for (const auto& field : hexes_.fields()) {
        layer.add_field(field);
    }
    layer.add_field(FieldDefinition("class_id", FieldType::STRING, 64));
    layer.add_field(FieldDefinition("coverage", FieldType::REAL, 10, 4));
    layer.add_field(FieldDefinition("source_layers", FieldType::STRING, 254));

    const std::string source_names = joined_source_names(sources);
    const auto id_field = hexes_.field_index("id");
    for (const auto& feature : hexes_.features()) {
        std::int64_t id = feature.fid;
        if (id_field) {
            id = field_as_int(feature.attributes[*id_field]).value_or(feature.fid);
        }
        auto hit = classes.coverage.find(id);
        if (hit == classes.coverage.end()) {
            continue;
        }
        const IndexedHex* hex = index_.find(id);
        std::vector<FieldValue> attributes = feature.attributes;
        attributes.resize(hexes_.fields().size());
        attributes.emplace_back(cls.class_id);
        attributes.emplace_back(hit->second);
        attributes.emplace_back(source_names);
        layer.add_feature(hex ? hex->geometry : feature.geometry, std::move(attributes));
    }

    logger_.detailed("Mosaic: " + cls.class_id + " -> " + std::to_string(layer.feature_count()) + " tiles");
    return layer;
}

std::optional<MemoryFeatureSource> MosaicBuilder::build_line_class(const MosaicClass& cls,
                                                                   const std::vector<const FeatureSource*>& sources,
                                                                   const MosaicClassState& state) {
    if (sources.empty()) {
        logger_.info("Mosaic: class '" + cls.class_id + "' skipped (no line sources selected).");
        return std::nullopt;
    }

    std::vector<Geometry> pieces;
    for (const FeatureSource* source : sources) {
        if (!source || !source->is_valid() || source->geometry_kind() != GeometryKind::LINE) {
            warnings_.push_back("Line source '" + (source ? source->name() : std::string()) +
                                "' is not a valid line layer; skipped.");
            logger_.warning(warnings_.back());
            continue;
        }

        std::optional<CoordinateTransformer> transform;
        if (!source->crs().same_as(hexes_.crs())) {
            try {
                transform.emplace(source->crs(), hexes_.crs());
            } catch (const InvalidArgument& e) {
                warnings_.push_back("Line source '" + source->name() + "' skipped: " + e.what());
                logger_.warning(warnings_.back());
                continue;
            }
        }

        for (const auto& feature : source->features()) {
            if (feature.geometry.is_empty()) {
                continue;
            }
            Geometry line = feature.geometry;
            if (transform) {
                try {
                    line = transform->transform_geometry(line);
                } catch (const InvalidArgument& e) {
                    logger_.debug("Line feature " + std::to_string(feature.fid) + " not reprojected: " + e.what());
                    continue;
                }
            }
            RepairResult repaired = line.make_valid();
            if (!repaired.ok()) {
                warnings_.push_back("Line feature " + std::to_string(feature.fid) + " of '" + source->name() +
                                    "' skipped: " + repaired.error);
                logger_.warning(warnings_.back());
                continue;
            }
            line = repaired.geometry.linear_part();
            if (line.is_empty()) {
                continue;
            }

            // The output layer keeps only linear parts, and a buffer polygon would absorb the edges it covers
            auto path = tracer_.trace_line(line, cls.line_behavior, 0.0, state.line_step);
            if (path && !path->is_empty()) {
                pieces.push_back(*path);
            }
        }
    }

    if (pieces.empty()) {
        logger_.info("Mosaic: class '" + cls.class_id + "' -> no line paths produced.");
        return std::nullopt;
    }

    const Geometry merged = Geometry::unary_union(pieces);
    if (merged.is_empty()) {
        logger_.info("Mosaic: class '" + cls.class_id + "' -> unable to merge generated line segments.");
        return std::nullopt;
    }

    MemoryFeatureSource layer(cls.target_layer, hexes_.crs(), GeometryKind::LINE);
    layer.add_field(FieldDefinition("class_id", FieldType::STRING, 64));
    layer.add_field(FieldDefinition("source_layers", FieldType::STRING, 254));

    const std::string source_names = joined_source_names(sources);
    for (const auto& part : merged.linear_part().parts()) {
        if (part.is_empty()) {
            continue;
        }
        layer.add_feature(part, {FieldValue(cls.class_id), FieldValue(source_names)});
    }

    if (layer.feature_count() == 0) {
        logger_.info("Mosaic: class '" + cls.class_id + "' -> no valid line geometries after union.");
        return std::nullopt;
    }
    logger_.detailed("Mosaic: " + cls.class_id + " -> " + std::to_string(layer.feature_count()) +
                     " line part(s), " + std::to_string(tracer_.cached_edges()) + " cached edges");
    return layer;
}

std::optional<MosaicOutput> MosaicBuilder::run_class(const MosaicClass& cls,
                                                     const std::vector<const FeatureSource*>& sources,
                                                     const MosaicClassState& state) {
    std::optional<MemoryFeatureSource> layer = cls.mode == MosaicMode::POLYGON
        ? build_polygon_class(cls, sources, state)
        : build_line_class(cls, sources, state);
    if (!layer) {
        return std::nullopt;
    }

    MosaicOutput output;
    output.class_id = cls.class_id;
    output.layer_name = output_name(hexes_.name(), cls.target_layer);
    output.path = paths_.mosaic_file(output.layer_name);
    output.feature_count = layer->feature_count();

    if (!exporter_.write_layer(*layer, output.path.string())) {
        warnings_.push_back("Mosaic: " + exporter_.last_error());
        logger_.warning(warnings_.back());
        return std::nullopt;
    }

    std::error_code ec;
    const auto relative = std::filesystem::relative(output.path, paths_.root(), ec);
    logger_.info("Mosaic: " + cls.class_id + " -> " + std::to_string(output.feature_count) +
                 (cls.mode == MosaicMode::POLYGON ? " tiles" : " line part(s)") + ", saved to " +
                 (ec ? output.path : relative).string() + ".");
    return output;
}

} // namespace hexmosaic
