/**
 * @file RasterSource.cpp
 * @brief In-memory and GDAL-backed raster sources
 */

#include "RasterSource.hpp"
#include "Logger.hpp"
#include <gdal_priv.h>
#include <cpl_conv.h>
#include <algorithm>

namespace hexmosaic {

BoundingBox RasterSource::extent() const {
    const auto gt = geo_transform();
    BoundingBox box = BoundingBox::null_box();
    const int w = width();
    const int h = height();
    for (int corner = 0; corner < 4; ++corner) {
        const double col = (corner & 1) ? w : 0;
        const double row = (corner & 2) ? h : 0;
        box.expand(Point2D(gt[0] + col * gt[1] + row * gt[2],
                           gt[3] + col * gt[4] + row * gt[5]));
    }
    return box;
}

// ============================================================================
// MemoryRasterSource
// ============================================================================

MemoryRasterSource::MemoryRasterSource(std::string name, Crs crs, int width, int height,
                                       const std::array<double, 6>& geo_transform,
                                       std::vector<double> values,
                                       std::optional<double> no_data)
    : name_(std::move(name)), crs_(std::move(crs)), width_(width), height_(height),
      geo_transform_(geo_transform), values_(std::move(values)), no_data_(no_data) {}

bool MemoryRasterSource::is_valid() const {
    return crs_.is_valid() && width_ > 0 && height_ > 0 &&
           values_.size() == static_cast<size_t>(width_) * static_cast<size_t>(height_) &&
           geo_transform_[1] != 0.0 && geo_transform_[5] != 0.0;
}

bool MemoryRasterSource::read_block(int x_offset, int y_offset, int x_size, int y_size,
                                    std::vector<double>& out) const {
    if (x_offset < 0 || y_offset < 0 || x_size <= 0 || y_size <= 0 ||
        x_offset + x_size > width_ || y_offset + y_size > height_) {
        return false;
    }
    out.resize(static_cast<size_t>(x_size) * static_cast<size_t>(y_size));
    for (int row = 0; row < y_size; ++row) {
        const auto src = values_.begin() + static_cast<std::ptrdiff_t>(y_offset + row) * width_ + x_offset;
        std::copy(src, src + x_size, out.begin() + static_cast<std::ptrdiff_t>(row) * x_size);
    }
    return true;
}

void MemoryRasterSource::set_value(int column, int row, double value) {
    if (column < 0 || row < 0 || column >= width_ || row >= height_) {
        return;
    }
    values_[static_cast<size_t>(row) * static_cast<size_t>(width_) + static_cast<size_t>(column)] = value;
}

// ============================================================================
// GdalRasterSource
// ============================================================================

struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

class GdalRasterSource::Impl {
public:
    explicit Impl(const std::string& path) : path_(path), logger_("GdalRasterSource") {
        GDALAllRegister();
        dataset_.reset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
        if (!dataset_) {
            logger_.error("Could not open raster: " + path);
            return;
        }
        if (dataset_->GetRasterCount() < 1) {
            logger_.error("Raster has no bands: " + path);
            dataset_.reset();
            return;
        }
        if (dataset_->GetGeoTransform(geotransform_.data()) != CE_None) {
            logger_.warning("Raster has no geotransform: " + path);
            dataset_.reset();
            return;
        }
        crs_ = Crs::from_ogr(dataset_->GetSpatialRef());

        GDALRasterBand* band = dataset_->GetRasterBand(1);
        int has_nodata = 0;
        double nodata = band->GetNoDataValue(&has_nodata);
        if (has_nodata) {
            no_data_ = nodata;
        }
        logger_.detailed("Opened raster " + path + " (" +
                         std::to_string(dataset_->GetRasterXSize()) + " x " +
                         std::to_string(dataset_->GetRasterYSize()) + ")");
    }

    std::string path_;
    Logger logger_;
    GDALDatasetPtr dataset_;
    std::array<double, 6> geotransform_{0, 1, 0, 0, 0, -1};
    Crs crs_;
    std::optional<double> no_data_;
};

GdalRasterSource::GdalRasterSource(const std::string& path)
    : impl_(std::make_unique<Impl>(path)) {}

GdalRasterSource::~GdalRasterSource() = default;

bool GdalRasterSource::is_valid() const {
    return impl_->dataset_ && impl_->crs_.is_valid();
}

std::string GdalRasterSource::name() const {
    return impl_->path_;
}

Crs GdalRasterSource::crs() const {
    return impl_->crs_;
}

int GdalRasterSource::width() const {
    return impl_->dataset_ ? impl_->dataset_->GetRasterXSize() : 0;
}

int GdalRasterSource::height() const {
    return impl_->dataset_ ? impl_->dataset_->GetRasterYSize() : 0;
}

std::array<double, 6> GdalRasterSource::geo_transform() const {
    return impl_->geotransform_;
}

std::optional<double> GdalRasterSource::no_data() const {
    return impl_->no_data_;
}

bool GdalRasterSource::read_block(int x_offset, int y_offset, int x_size, int y_size,
                                  std::vector<double>& out) const {
    if (!impl_->dataset_) {
        return false;
    }
    if (x_offset < 0 || y_offset < 0 || x_size <= 0 || y_size <= 0 ||
        x_offset + x_size > width() || y_offset + y_size > height()) {
        return false;
    }

    out.resize(static_cast<size_t>(x_size) * static_cast<size_t>(y_size));
    GDALRasterBand* band = impl_->dataset_->GetRasterBand(1);
    CPLErr err = band->RasterIO(GF_Read, x_offset, y_offset, x_size, y_size,
                                out.data(), x_size, y_size, GDT_Float64, 0, 0);
    if (err != CE_None) {
        impl_->logger_.error("Raster read failed at (" + std::to_string(x_offset) + ", " +
                             std::to_string(y_offset) + "): " + CPLGetLastErrorMsg());
        return false;
    }
    return true;
}

} // namespace hexmosaic
