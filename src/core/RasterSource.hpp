#pragma once

/**
 * @file RasterSource.hpp
 * @brief Read access to a single-band elevation raster
 */

#include "hexmosaic.hpp"
#include "SpatialReference.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief Abstract single-band raster
 *
 * Geotransform layout follows GDAL: origin x, pixel width, row rotation,
 * origin y, column rotation, pixel height (negative for north-up).
 */
class RasterSource {
public:
    virtual ~RasterSource() = default;

    virtual bool is_valid() const = 0;

    /// Identifier recorded as the DEM source of derived layers
    virtual std::string name() const = 0;

    virtual Crs crs() const = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual std::array<double, 6> geo_transform() const = 0;
    virtual std::optional<double> no_data() const = 0;

    /**
     * @brief Read a window of band 1 as doubles, row-major
     * @return false if the window is outside the raster or the read failed
     */
    virtual bool read_block(int x_offset, int y_offset, int x_size, int y_size,
                            std::vector<double>& out) const = 0;

    BoundingBox extent() const;
};

/**
 * @brief Raster held in memory
 */
class MemoryRasterSource : public RasterSource {
public:
    MemoryRasterSource(std::string name, Crs crs, int width, int height,
                       const std::array<double, 6>& geo_transform,
                       std::vector<double> values,
                       std::optional<double> no_data = std::nullopt);

    bool is_valid() const override;
    std::string name() const override { return name_; }
    Crs crs() const override { return crs_; }
    int width() const override { return width_; }
    int height() const override { return height_; }
    std::array<double, 6> geo_transform() const override { return geo_transform_; }
    std::optional<double> no_data() const override { return no_data_; }

    bool read_block(int x_offset, int y_offset, int x_size, int y_size,
                    std::vector<double>& out) const override;

    void set_value(int column, int row, double value);

private:
    std::string name_;
    Crs crs_;
    int width_;
    int height_;
    std::array<double, 6> geo_transform_;
    std::vector<double> values_;
    std::optional<double> no_data_;
};

/**
 * @brief Band 1 of a GDAL raster dataset (GeoTIFF, VRT, ...)
 */
class GdalRasterSource : public RasterSource {
public:
    explicit GdalRasterSource(const std::string& path);
    ~GdalRasterSource() override;

    bool is_valid() const override;
    std::string name() const override;
    Crs crs() const override;
    int width() const override;
    int height() const override;
    std::array<double, 6> geo_transform() const override;
    std::optional<double> no_data() const override;

    bool read_block(int x_offset, int y_offset, int x_size, int y_size,
                    std::vector<double>& out) const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hexmosaic
