/**
 * @file HexIndex.cpp
 * @brief Hex cell lookup backed by GDAL's CPLQuadTree
 */

#include "HexIndex.hpp"
#include "FeatureSource.hpp"
#include "HexGridTessellator.hpp"
#include "Logger.hpp"
#include <cpl_conv.h>
#include <cpl_quad_tree.h>
#include <algorithm>
#include <limits>
#include <map>

namespace hexmosaic {

namespace {

constexpr double kBoundaryTolerance = 1e-9;
constexpr double kDefaultSpacing = 200.0;

void hex_bounds(const void* feature, CPLRectObj* bounds) {
    const auto* hex = static_cast<const IndexedHex*>(feature);
    bounds->minx = hex->bounds.min_x;
    bounds->miny = hex->bounds.min_y;
    bounds->maxx = hex->bounds.max_x;
    bounds->maxy = hex->bounds.max_y;
}

} // namespace

class HexIndex::Impl {
public:
    Impl() : logger_("HexIndex") {}

    ~Impl() {
        if (tree_) {
            CPLQuadTreeDestroy(tree_);
        }
    }

    void add(std::int64_t id, const Geometry& geometry) {
        if (geometry.is_empty()) {
            return;
        }
        RepairResult repaired = geometry.make_valid();
        if (!repaired.ok()) {
            warnings_.push_back("Hex " + std::to_string(id) + " skipped: " + repaired.error);
            logger_.warning(warnings_.back());
            return;
        }
        Geometry polygons = repaired.geometry.polygonal_part();
        if (polygons.is_empty()) {
            return;
        }

        IndexedHex hex;
        hex.id = id;
        hex.geometry = polygons;
        hex.area = polygons.area();
        hex.bounds = polygons.envelope();
        hex.centroid = polygons.centroid().value_or(hex.bounds.center());
        cells_.push_back(std::move(hex));
    }

    void build() {
        std::sort(cells_.begin(), cells_.end(),
                  [](const IndexedHex& a, const IndexedHex& b) { return a.id < b.id; });
        for (size_t i = 0; i < cells_.size(); ++i) {
            by_id_[cells_[i].id] = i;
        }
        if (cells_.empty()) {
            return;
        }

        BoundingBox global = BoundingBox::null_box();
        for (const auto& cell : cells_) {
            global.expand(Point2D(cell.bounds.min_x, cell.bounds.min_y));
            global.expand(Point2D(cell.bounds.max_x, cell.bounds.max_y));
        }
        global_ = global;

        CPLRectObj rect;
        rect.minx = global.min_x;
        rect.miny = global.min_y;
        rect.maxx = global.max_x;
        rect.maxy = global.max_y;
        tree_ = CPLQuadTreeCreate(&rect, hex_bounds);
        // Entries point into cells_, which is not modified after this
        for (auto& cell : cells_) {
            CPLQuadTreeInsert(tree_, &cell);
        }
        logger_.debug("Indexed " + std::to_string(cells_.size()) + " hexes");
    }

    std::vector<const IndexedHex*> search(const BoundingBox& box) const {
        std::vector<const IndexedHex*> found;
        if (!tree_) {
            return found;
        }
        CPLRectObj rect;
        rect.minx = box.min_x;
        rect.miny = box.min_y;
        rect.maxx = box.max_x;
        rect.maxy = box.max_y;
        int count = 0;
        void** hits = CPLQuadTreeSearch(tree_, &rect, &count);
        found.reserve(static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            found.push_back(static_cast<const IndexedHex*>(hits[i]));
        }
        CPLFree(hits);
        std::sort(found.begin(), found.end(),
                  [](const IndexedHex* a, const IndexedHex* b) { return a->id < b->id; });
        return found;
    }

    Crs crs_;
    Logger logger_;
    std::vector<IndexedHex> cells_;
    std::map<std::int64_t, size_t> by_id_;
    std::vector<std::string> warnings_;
    BoundingBox global_ = BoundingBox::null_box();
    CPLQuadTree* tree_ = nullptr;
};

HexIndex::HexIndex(const FeatureSource& hexes) : impl_(std::make_unique<Impl>()) {
    impl_->crs_ = hexes.crs();
    const auto id_field = hexes.field_index("id");
    for (const auto& feature : hexes.features()) {
        std::int64_t id = feature.fid;
        if (id_field) {
            id = field_as_int(feature.attributes[*id_field]).value_or(feature.fid);
        }
        impl_->add(id, feature.geometry);
    }
    impl_->build();
}

HexIndex::HexIndex(const TessellationResult& tessellation) : impl_(std::make_unique<Impl>()) {
    impl_->crs_ = tessellation.crs;
    for (const auto& cell : tessellation.cells) {
        impl_->add(cell.id, cell.geometry);
    }
    impl_->build();
}

HexIndex::~HexIndex() = default;

std::optional<std::int64_t> HexIndex::containing(const Point2D& point) const {
    const BoundingBox probe(point.x() - kBoundaryTolerance, point.y() - kBoundaryTolerance,
                            point.x() + kBoundaryTolerance, point.y() + kBoundaryTolerance);
    const Geometry location = Geometry::point(point);
    for (const IndexedHex* hex : impl_->search(probe)) {
        if (hex->geometry.intersects(location)) {
            return hex->id;
        }
        const double d = hex->geometry.distance(location);
        if (d >= 0.0 && d <= kBoundaryTolerance) {
            return hex->id;
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> HexIndex::nearest(const Point2D& point) const {
    if (impl_->cells_.empty()) {
        return std::nullopt;
    }
    const Geometry location = Geometry::point(point);

    auto best_of = [&location](const std::vector<const IndexedHex*>& hexes, double& best_distance) {
        std::optional<std::int64_t> best;
        for (const IndexedHex* hex : hexes) {
            const double d = hex->geometry.distance(location);
            if (d >= 0.0 && d < best_distance) {
                best_distance = d;
                best = hex->id;
            }
        }
        return best;
    };

    // Grow the search window until it finds something, then confirm with a
    // window that covers the whole circle of the best distance
    const BoundingBox& global = impl_->global_;
    const double limit = std::max(global.width(), global.height()) +
                         std::max(std::abs(point.x() - global.center().x()),
                                  std::abs(point.y() - global.center().y()));
    double radius = std::max(estimated_spacing(), kBoundaryTolerance);
    while (true) {
        auto hits = impl_->search(BoundingBox(point.x() - radius, point.y() - radius,
                                              point.x() + radius, point.y() + radius));
        if (!hits.empty() || radius > limit) {
            double best_distance = std::numeric_limits<double>::infinity();
            auto best = best_of(hits, best_distance);
            if (!best) {
                break;
            }
            auto confirm = impl_->search(BoundingBox(point.x() - best_distance, point.y() - best_distance,
                                                     point.x() + best_distance, point.y() + best_distance));
            double confirmed_distance = std::numeric_limits<double>::infinity();
            auto confirmed = best_of(confirm, confirmed_distance);
            return confirmed ? confirmed : best;
        }
        radius *= 2.0;
    }

    std::vector<const IndexedHex*> all;
    for (const auto& cell : impl_->cells_) {
        all.push_back(&cell);
    }
    double best_distance = std::numeric_limits<double>::infinity();
    return best_of(all, best_distance);
}

std::optional<std::int64_t> HexIndex::locate(const Point2D& point) const {
    auto hit = containing(point);
    if (hit) {
        return hit;
    }
    return nearest(point);
}

std::vector<std::int64_t> HexIndex::candidates(const BoundingBox& box) const {
    std::vector<std::int64_t> ids;
    for (const IndexedHex* hex : impl_->search(box)) {
        ids.push_back(hex->id);
    }
    return ids;
}

const IndexedHex* HexIndex::find(std::int64_t id) const {
    auto it = impl_->by_id_.find(id);
    if (it == impl_->by_id_.end()) {
        return nullptr;
    }
    return &impl_->cells_[it->second];
}

const std::vector<IndexedHex>& HexIndex::cells() const {
    return impl_->cells_;
}

double HexIndex::estimated_spacing() const {
    if (impl_->cells_.empty()) {
        return kDefaultSpacing;
    }
    const BoundingBox& first = impl_->cells_.front().bounds;
    return std::max(first.width(), first.height());
}

const Crs& HexIndex::crs() const {
    return impl_->crs_;
}

const std::vector<std::string>& HexIndex::warnings() const {
    return impl_->warnings_;
}

} // namespace hexmosaic
