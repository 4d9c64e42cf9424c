/**
 * @file LineTracer.cpp
 * @brief Centroid and shared-edge paths through a hex lattice
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "LineTracer.hpp"
#include "Errors.hpp"
#include "HexIndex.hpp"
#include <algorithm>
#include <cctype>

namespace hexmosaic {

namespace {

constexpr double kMinimumStepFactor = 0.3;

} // namespace

LineBehavior parse_line_behavior(const std::string& text) {
    std::string key = text;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "centroid_path" || key == "centroid" || key == "center_to_edge" || key.empty()) {
        return LineBehavior::CENTROID_PATH;
    }
    if (key == "edge_path" || key == "edge") {
        return LineBehavior::EDGE_PATH;
    }
    throw InvalidArgument("Unsupported line behavior: " + text);
}

std::string to_string(LineBehavior behavior) {
    return behavior == LineBehavior::EDGE_PATH ? "edge_path" : "centroid_path";
}

LineTracer::LineTracer(const HexIndex& index) : index_(index), logger_("LineTracer") {}

std::vector<std::int64_t> LineTracer::visited_hexes(const Geometry& line, double step_distance) const {
    std::vector<std::int64_t> ids;
    const double length = line.length();
    if (!(length > 0.0)) {
        return ids;
    }

    const double step = std::max(step_distance, index_.estimated_spacing() * kMinimumStepFactor);
    auto visit = [&](double distance) {
        auto point = line.interpolate(distance);
        if (!point) {
            return;
        }
        auto id = index_.locate(*point);
        if (id && (ids.empty() || ids.back() != *id)) {
            ids.push_back(*id);
        }
    };

    for (double distance = 0.0; distance < length; distance += step) {
        visit(distance);
    }
    visit(length);
    return ids;
}

std::optional<Geometry> LineTracer::shared_edge(std::int64_t a, std::int64_t b) {
    const std::pair<std::int64_t, std::int64_t> key = std::minmax(a, b);
    auto cached = edge_cache_.find(key);
    if (cached != edge_cache_.end()) {
        return cached->second;
    }

    std::optional<Geometry> edge;
    const IndexedHex* hex_a = index_.find(a);
    const IndexedHex* hex_b = index_.find(b);
    if (hex_a && hex_b && a != b) {
        Geometry shared = hex_a->geometry.intersection(hex_b->geometry);
        if (shared.is_empty() || shared.kind() == GeometryKind::POINT) {
            shared = hex_a->geometry.boundary().intersection(hex_b->geometry.boundary());
        }
        if (shared.is_polygonal()) {
            shared = shared.boundary();
        } else if (shared.kind() == GeometryKind::MIXED) {
            shared = Geometry::unary_union({shared.polygonal_part().boundary(), shared.linear_part()});
        }
        Geometry lines = shared.linear_part();
        if (!lines.is_empty()) {
            edge = lines;
        }
    }

    edge_cache_.emplace(key, edge);
    return edge;
}

std::optional<Geometry> LineTracer::centroid_path(const std::vector<std::int64_t>& ids) const {
    std::vector<Point2D> points;
    points.reserve(ids.size());
    for (std::int64_t id : ids) {
        if (const IndexedHex* hex = index_.find(id)) {
            points.push_back(hex->centroid);
        }
    }
    if (points.size() < 2) {
        return std::nullopt;
    }
    return Geometry::line_string(points);
}

std::optional<Geometry> LineTracer::edge_path(const std::vector<std::int64_t>& ids, const Geometry& line,
                                              double buffer_distance) {
    std::vector<Geometry> segments;
    for (size_t i = 0; i + 1 < ids.size(); ++i) {
        auto edge = shared_edge(ids[i], ids[i + 1]);
        if (edge) {
            segments.push_back(*edge);
        }
    }
    if (buffer_distance > 0.0) {
        Geometry buffered = line.buffer(buffer_distance, 8);
        if (!buffered.is_empty()) {
            segments.push_back(buffered);
        }
    }
    if (segments.empty()) {
        return std::nullopt;
    }

    Geometry merged = Geometry::unary_union(segments);
    if (merged.is_empty()) {
        return std::nullopt;
    }
    return merged;
}

std::optional<Geometry> LineTracer::trace_line(const Geometry& line, LineBehavior behavior,
                                               double buffer_distance, double step_distance) {
    const auto ids = visited_hexes(line, step_distance);
    if (ids.size() < 2) {
        logger_.debug("Line visits " + std::to_string(ids.size()) + " hex(es); no path");
        return std::nullopt;
    }
    logger_.trace("Line visits " + std::to_string(ids.size()) + " hexes");

    if (behavior == LineBehavior::EDGE_PATH) {
        return edge_path(ids, line, buffer_distance);
    }
    return centroid_path(ids);
}

std::optional<Geometry> trace_line(const HexIndex& index, const Geometry& line, LineBehavior behavior,
                                   double buffer_distance, double step_distance) {
    LineTracer tracer(index);
    return tracer.trace_line(line, behavior, buffer_distance, step_distance);
}

} // namespace hexmosaic
