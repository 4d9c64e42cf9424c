#pragma once

/**
 * @file LineTracer.hpp
 * @brief Snaps line features onto a hex lattice
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "hexmosaic.hpp"
#include "Geometry.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hexmosaic {

class HexIndex;

/// @throws InvalidArgument("Unsupported line behavior: ...")
LineBehavior parse_line_behavior(const std::string& text);
std::string to_string(LineBehavior behavior);

/**
 * @brief Traces lines through the cells of one hex index
 *
 * The tracer keeps a cache of shared edges per unordered cell pair, so
 * one instance should be reused for every line of a class. The index must
 * outlive the tracer.
 */
class LineTracer {
public:
    explicit LineTracer(const HexIndex& index);

    /**
     * @brief Hex path of a line
     *
     * The line is sampled every max(step_distance, 0.3 * hex spacing) and
     * at its endpoint. Each sample resolves to the containing or nearest
     * cell; consecutive repeats collapse.
     *
     * @param line Line in the index CRS
     * @param behavior Centroid polyline or union of shared edges
     * @param buffer_distance Buffer of the source line added to edge paths
     *        when positive
     * @param step_distance Minimum sampling step in CRS units
     * @return Path geometry, or nullopt when fewer than two cells are visited
     */
    std::optional<Geometry> trace_line(const Geometry& line, LineBehavior behavior,
                                       double buffer_distance, double step_distance);

    /// Cell ids visited along the line, consecutive repeats collapsed
    std::vector<std::int64_t> visited_hexes(const Geometry& line, double step_distance) const;

    /// Linear boundary shared by two cells, if any
    std::optional<Geometry> shared_edge(std::int64_t a, std::int64_t b);

    std::size_t cached_edges() const { return edge_cache_.size(); }

private:
    std::optional<Geometry> centroid_path(const std::vector<std::int64_t>& ids) const;
    std::optional<Geometry> edge_path(const std::vector<std::int64_t>& ids, const Geometry& line,
                                      double buffer_distance);

    const HexIndex& index_;
    std::map<std::pair<std::int64_t, std::int64_t>, std::optional<Geometry>> edge_cache_;
    Logger logger_;
};

/// One-shot trace with a fresh edge cache
std::optional<Geometry> trace_line(const HexIndex& index, const Geometry& line, LineBehavior behavior,
                                   double buffer_distance, double step_distance);

} // namespace hexmosaic
