#pragma once

#include "types.hpp"
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace udmis {

class UnitDiskGraph;

// Shared, read-only handle; one graph can back many engines
using GraphPtr = std::shared_ptr<const UnitDiskGraph>;

// Unit-disk graph over an ordered point set.
// Vertex i is points[i]; i ~ j iff i != j and |p_i - p_j| <= radius.
// Immutable once built. Neighbors are kept as sorted CSR lists.
class UnitDiskGraph {
public:
    UnitDiskGraph() = default;

    // O(n^2) pairwise construction (reference builder)
    static UnitDiskGraph build(std::span<const Vec2> points, double radius = UNIT_DISK_RADIUS);

    // Same relation as build(), candidate pairs taken from a CellGrid
    static UnitDiskGraph build_gridded(std::span<const Vec2> points, double radius = UNIT_DISK_RADIUS);

    [[nodiscard]] size_t size() const { return points_.size(); }
    [[nodiscard]] bool empty() const { return points_.empty(); }
    [[nodiscard]] size_t num_edges() const { return neighbors_.size() / 2; }
    [[nodiscard]] double radius() const { return radius_; }
    [[nodiscard]] const std::vector<Vec2>& points() const { return points_; }
    [[nodiscard]] const Vec2& point(Index i) const;

    // Throws std::out_of_range for indices outside [0, size())
    [[nodiscard]] bool adjacent(Index i, Index j) const;

    // Sorted neighbors of i
    [[nodiscard]] std::span<const Index> neighbors(Index i) const {
        return {neighbors_.data() + offsets_[static_cast<size_t>(i)],
                neighbors_.data() + offsets_[static_cast<size_t>(i) + 1]};
    }

    [[nodiscard]] int degree(Index i) const {
        return offsets_[static_cast<size_t>(i) + 1] - offsets_[static_cast<size_t>(i)];
    }

    [[nodiscard]] int max_degree() const;

    // Each undirected edge once, as (i, j) with i < j, in lexicographic order
    [[nodiscard]] std::vector<std::pair<Index, Index>> edges() const;

    void check_index(Index i) const;

private:
    std::vector<Vec2> points_;
    double radius_{UNIT_DISK_RADIUS};
    // neighbors_[offsets_[i] .. offsets_[i + 1]) are the neighbors of i
    std::vector<int> offsets_{0};
    std::vector<Index> neighbors_;

    static void validate(std::span<const Vec2> points, double radius);
    static UnitDiskGraph from_adjacency(
        std::span<const Vec2> points,
        double radius,
        std::vector<std::vector<Index>>& adjacency
    );
};

// Builds the unit-disk adjacency of `points` (pure function)
[[nodiscard]] inline UnitDiskGraph build_edges(std::span<const Vec2> points, double radius = UNIT_DISK_RADIUS) {
    return UnitDiskGraph::build(points, radius);
}

// Grid-accelerated variant for large point sets
[[nodiscard]] inline UnitDiskGraph build_edges_grid(std::span<const Vec2> points, double radius = UNIT_DISK_RADIUS) {
    return UnitDiskGraph::build_gridded(points, radius);
}

}  // namespace udmis
