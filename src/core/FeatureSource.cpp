/**
 * @file FeatureSource.cpp
 * @brief In-memory and OGR-backed feature sources
 */

#include "FeatureSource.hpp"
#include "Logger.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <algorithm>
#include <cctype>
#include <cmath>

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

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

GeometryKind kind_from_ogr_type(OGRwkbGeometryType type) {
    switch (wkbFlatten(type)) {
        case wkbPoint:
        case wkbMultiPoint:
            return GeometryKind::POINT;
        case wkbLineString:
        case wkbMultiLineString:
        case wkbCircularString:
        case wkbCompoundCurve:
        case wkbMultiCurve:
            return GeometryKind::LINE;
        case wkbPolygon:
        case wkbMultiPolygon:
        case wkbCurvePolygon:
        case wkbMultiSurface:
            return GeometryKind::POLYGON;
        case wkbNone:
            return GeometryKind::EMPTY;
        default:
            return GeometryKind::MIXED;
    }
}

FieldType field_type_from_ogr(OGRFieldType type) {
    switch (type) {
        case OFTInteger:
        case OFTInteger64:
            return FieldType::INTEGER;
        case OFTReal:
            return FieldType::REAL;
        default:
            return FieldType::STRING;
    }
}

} // namespace

// ============================================================================
// Attribute helpers
// ============================================================================

std::optional<double> field_as_double(const FieldValue& value) {
    if (const auto* i = std::get_if<std::int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* s = std::get_if<std::string>(&value)) {
        try {
            size_t used = 0;
            double parsed = std::stod(*s, &used);
            if (used == s->size()) return parsed;
        } catch (const std::exception&) {
            // Not numeric; fall through
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> field_as_int(const FieldValue& value) {
    if (const auto* i = std::get_if<std::int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d) && std::floor(*d) == *d) return static_cast<std::int64_t>(*d);
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        try {
            size_t used = 0;
            long long parsed = std::stoll(*s, &used);
            if (used == s->size()) return static_cast<std::int64_t>(parsed);
        } catch (const std::exception&) {
            // Not an integer; fall through
        }
    }
    return std::nullopt;
}

std::string field_as_string(const FieldValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* i = std::get_if<std::int64_t>(&value)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&value)) return std::to_string(*d);
    return "";
}

std::optional<std::size_t> FeatureSource::field_index(const std::string& field_name) const {
    const std::string wanted = lower(field_name);
    const auto& defs = fields();
    for (std::size_t i = 0; i < defs.size(); ++i) {
        if (lower(defs[i].name) == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

// ============================================================================
// MemoryFeatureSource
// ============================================================================

MemoryFeatureSource::MemoryFeatureSource(std::string name, Crs crs, GeometryKind kind)
    : name_(std::move(name)), crs_(std::move(crs)), kind_(kind) {}

std::size_t MemoryFeatureSource::add_field(const FieldDefinition& field) {
    fields_.push_back(field);
    for (auto& feature : features_) {
        feature.attributes.resize(fields_.size());
    }
    return fields_.size() - 1;
}

std::int64_t MemoryFeatureSource::add_feature(const Geometry& geometry,
                                              std::vector<FieldValue> attributes,
                                              std::optional<std::int64_t> fid) {
    Feature feature;
    feature.fid = fid.value_or(next_fid_);
    feature.geometry = geometry;
    feature.attributes = std::move(attributes);
    feature.attributes.resize(fields_.size());
    next_fid_ = std::max(next_fid_, feature.fid + 1);
    features_.push_back(std::move(feature));
    return features_.back().fid;
}

void MemoryFeatureSource::set_attribute(std::size_t feature_index, std::size_t field, FieldValue value) {
    if (feature_index >= features_.size() || field >= fields_.size()) {
        return;
    }
    features_[feature_index].attributes[field] = std::move(value);
}

// ============================================================================
// OgrFeatureSource
// ============================================================================

OgrFeatureSource::OgrFeatureSource(const std::string& path, const std::string& layer_name)
    : path_(path) {
    Logger logger("OgrFeatureSource");
    GDALAllRegister();

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        last_error_ = "Could not open vector dataset: " + path;
        logger.error(last_error_);
        return;
    }

    OGRLayer* layer = layer_name.empty() ? dataset->GetLayer(0)
                                         : dataset->GetLayerByName(layer_name.c_str());
    if (!layer) {
        last_error_ = "Layer '" + (layer_name.empty() ? std::string("#0") : layer_name) +
                      "' not found in " + path;
        logger.error(last_error_);
        return;
    }

    name_ = layer->GetName();
    crs_ = Crs::from_ogr(layer->GetSpatialRef());
    kind_ = kind_from_ogr_type(layer->GetGeomType());

    OGRFeatureDefn* defn = layer->GetLayerDefn();
    for (int i = 0; i < defn->GetFieldCount(); ++i) {
        OGRFieldDefn* field = defn->GetFieldDefn(i);
        fields_.emplace_back(field->GetNameRef(), field_type_from_ogr(field->GetType()),
                             field->GetWidth(), field->GetPrecision());
    }

    layer->ResetReading();
    OGRFeature* raw = nullptr;
    while ((raw = layer->GetNextFeature()) != nullptr) {
        OGRFeatureUniquePtr ogr_feature(raw);

        Feature feature;
        feature.fid = ogr_feature->GetFID();
        if (const OGRGeometry* geometry = ogr_feature->GetGeometryRef()) {
            feature.geometry = Geometry::wrap(geometry->clone());
        }
        feature.attributes.resize(fields_.size());
        for (int i = 0; i < static_cast<int>(fields_.size()); ++i) {
            if (!ogr_feature->IsFieldSetAndNotNull(i)) continue;
            switch (fields_[static_cast<size_t>(i)].type) {
                case FieldType::INTEGER:
                    feature.attributes[static_cast<size_t>(i)] =
                        static_cast<std::int64_t>(ogr_feature->GetFieldAsInteger64(i));
                    break;
                case FieldType::REAL:
                    feature.attributes[static_cast<size_t>(i)] = ogr_feature->GetFieldAsDouble(i);
                    break;
                case FieldType::STRING:
                    feature.attributes[static_cast<size_t>(i)] = std::string(ogr_feature->GetFieldAsString(i));
                    break;
            }
        }

        if (kind_ == GeometryKind::MIXED && !feature.geometry.is_empty()) {
            // Unknown layer type (common for GeoJSON): adopt the first geometry's family
            kind_ = feature.geometry.kind();
        }
        features_.push_back(std::move(feature));
    }

    valid_ = crs_.is_valid();
    if (!valid_) {
        last_error_ = "Layer '" + name_ + "' has no coordinate reference system";
        logger.warning(last_error_);
    }
    logger.detailed("Read " + std::to_string(features_.size()) + " features from " + path);
}

} // namespace hexmosaic
