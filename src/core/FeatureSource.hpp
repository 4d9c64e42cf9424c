#pragma once

/**
 * @file FeatureSource.hpp
 * @brief Read access to named vector feature collections
 */

#include "Geometry.hpp"
#include "SpatialReference.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hexmosaic {

/**
 * @brief Attribute value; monostate is a NULL field
 */
using FieldValue = std::variant<std::monostate, std::int64_t, double, std::string>;

enum class FieldType {
    INTEGER,
    REAL,
    STRING
};

struct FieldDefinition {
    std::string name;
    FieldType type = FieldType::STRING;
    int width = 0;
    int precision = 0;

    FieldDefinition() = default;
    FieldDefinition(std::string field_name, FieldType field_type, int field_width = 0, int field_precision = 0)
        : name(std::move(field_name)), type(field_type), width(field_width), precision(field_precision) {}
};

struct Feature {
    std::int64_t fid = 0;
    Geometry geometry;
    std::vector<FieldValue> attributes;
};

/// Numeric view of an attribute, if it holds a number
std::optional<double> field_as_double(const FieldValue& value);

/// Integer view of an attribute, if it holds an integer or integral real
std::optional<std::int64_t> field_as_int(const FieldValue& value);

std::string field_as_string(const FieldValue& value);

/**
 * @brief Abstract vector layer
 */
class FeatureSource {
public:
    virtual ~FeatureSource() = default;

    virtual std::string name() const = 0;
    virtual Crs crs() const = 0;
    virtual bool is_valid() const = 0;

    /// Declared geometry family of the layer
    virtual GeometryKind geometry_kind() const = 0;

    virtual const std::vector<FieldDefinition>& fields() const = 0;
    virtual const std::vector<Feature>& features() const = 0;

    /// Case-insensitive field lookup
    std::optional<std::size_t> field_index(const std::string& field_name) const;

    std::size_t feature_count() const { return features().size(); }
};

/**
 * @brief Feature collection held in memory
 *
 * Used for every derived layer the core produces and as the working
 * copy handed to the statistics engine.
 */
class MemoryFeatureSource : public FeatureSource {
public:
    MemoryFeatureSource(std::string name, Crs crs, GeometryKind kind = GeometryKind::POLYGON);

    std::string name() const override { return name_; }
    Crs crs() const override { return crs_; }
    bool is_valid() const override { return crs_.is_valid(); }
    GeometryKind geometry_kind() const override { return kind_; }
    const std::vector<FieldDefinition>& fields() const override { return fields_; }
    const std::vector<Feature>& features() const override { return features_; }

    /**
     * @brief Append a field; existing features receive NULL
     * @return Index of the new field
     */
    std::size_t add_field(const FieldDefinition& field);

    /**
     * @brief Append a feature
     *
     * Attributes are padded with NULL to the field count. When no fid is
     * given the next sequential fid (starting at 1) is used.
     *
     * @return The feature's fid
     */
    std::int64_t add_feature(const Geometry& geometry,
                             std::vector<FieldValue> attributes = {},
                             std::optional<std::int64_t> fid = std::nullopt);

    void set_attribute(std::size_t feature_index, std::size_t field, FieldValue value);

private:
    std::string name_;
    Crs crs_;
    GeometryKind kind_;
    std::vector<FieldDefinition> fields_;
    std::vector<Feature> features_;
    std::int64_t next_fid_ = 1;
};

/**
 * @brief Vector layer read through OGR (shapefile, GeoPackage, GeoJSON, ...)
 *
 * The layer is read completely when constructed; the dataset is closed
 * again before the constructor returns.
 */
class OgrFeatureSource : public FeatureSource {
public:
    /**
     * @param path Dataset path
     * @param layer_name Layer to read; empty selects the first layer
     */
    explicit OgrFeatureSource(const std::string& path, const std::string& layer_name = "");

    std::string name() const override { return name_; }
    Crs crs() const override { return crs_; }
    bool is_valid() const override { return valid_; }
    GeometryKind geometry_kind() const override { return kind_; }
    const std::vector<FieldDefinition>& fields() const override { return fields_; }
    const std::vector<Feature>& features() const override { return features_; }

    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::string path_;
    std::string name_;
    Crs crs_;
    GeometryKind kind_ = GeometryKind::EMPTY;
    bool valid_ = false;
    std::string last_error_;
    std::vector<FieldDefinition> fields_;
    std::vector<Feature> features_;
};

} // namespace hexmosaic
