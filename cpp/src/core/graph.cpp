#include "udmis/core/graph.hpp"
#include "udmis/core/errors.hpp"
#include "udmis/spatial/cell_grid.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace udmis {

void UnitDiskGraph::validate(std::span<const Vec2> points, double radius) {
    if (!std::isfinite(radius) || radius <= 0.0) {
        throw InvalidInputError("UnitDiskGraph: radius must be finite and positive, got " + std::to_string(radius));
    }
    for (size_t i = 0; i < points.size(); ++i) {
        if (!points[i].is_finite()) {
            throw InvalidInputError("UnitDiskGraph: point " + std::to_string(i) + " has a non-finite coordinate");
        }
    }
}

UnitDiskGraph UnitDiskGraph::from_adjacency(
    std::span<const Vec2> points,
    double radius,
    std::vector<std::vector<Index>>& adjacency
) {
    UnitDiskGraph graph;
    graph.points_.assign(points.begin(), points.end());
    graph.radius_ = radius;

    const size_t n = points.size();
    graph.offsets_.assign(n + 1, 0);
    for (size_t i = 0; i < n; ++i) {
        std::sort(adjacency[i].begin(), adjacency[i].end());
        graph.offsets_[i + 1] = graph.offsets_[i] + static_cast<int>(adjacency[i].size());
    }

    graph.neighbors_.reserve(static_cast<size_t>(graph.offsets_[n]));
    for (size_t i = 0; i < n; ++i) {
        graph.neighbors_.insert(graph.neighbors_.end(), adjacency[i].begin(), adjacency[i].end());
    }
    return graph;
}

UnitDiskGraph UnitDiskGraph::build(std::span<const Vec2> points, double radius) {
    validate(points, radius);

    const size_t n = points.size();
    std::vector<std::vector<Index>> adjacency(n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (points[i].distance(points[j]) <= radius) {
                adjacency[i].push_back(static_cast<Index>(j));
                adjacency[j].push_back(static_cast<Index>(i));
            }
        }
    }
    return from_adjacency(points, radius, adjacency);
}

UnitDiskGraph UnitDiskGraph::build_gridded(std::span<const Vec2> points, double radius) {
    validate(points, radius);

    const size_t n = points.size();
    std::vector<Vec2> owned(points.begin(), points.end());
    // Coordinates near the double limits: no finite cell size covers the spread
    if (!AABB::of(owned).size().is_finite()) {
        return build(points, radius);
    }
    CellGrid grid = CellGrid::init(owned, radius);

    std::vector<std::vector<Index>> adjacency(n);
    std::vector<Index> candidates;
    for (size_t i = 0; i < n; ++i) {
        grid.get_candidates(static_cast<Index>(i), candidates);
        for (Index j : candidates) {
            // Each pair is seen from both ends; keep it once
            if (static_cast<size_t>(j) <= i) continue;
            if (points[i].distance(points[static_cast<size_t>(j)]) <= radius) {
                adjacency[i].push_back(j);
                adjacency[static_cast<size_t>(j)].push_back(static_cast<Index>(i));
            }
        }
    }
    return from_adjacency(points, radius, adjacency);
}

void UnitDiskGraph::check_index(Index i) const {
    if (i < 0 || static_cast<size_t>(i) >= points_.size()) {
        throw std::out_of_range(
            "vertex index " + std::to_string(i) + " out of range [0, " + std::to_string(points_.size()) + ")"
        );
    }
}

const Vec2& UnitDiskGraph::point(Index i) const {
    check_index(i);
    return points_[static_cast<size_t>(i)];
}

bool UnitDiskGraph::adjacent(Index i, Index j) const {
    check_index(i);
    check_index(j);
    if (i == j) return false;
    auto nbrs = neighbors(i);
    return std::binary_search(nbrs.begin(), nbrs.end(), j);
}

int UnitDiskGraph::max_degree() const {
    int best = 0;
    for (size_t i = 0; i < size(); ++i) {
        best = std::max(best, degree(static_cast<Index>(i)));
    }
    return best;
}

std::vector<std::pair<Index, Index>> UnitDiskGraph::edges() const {
    std::vector<std::pair<Index, Index>> result;
    result.reserve(num_edges());
    for (size_t i = 0; i < size(); ++i) {
        for (Index j : neighbors(static_cast<Index>(i))) {
            if (j > static_cast<Index>(i)) {
                result.emplace_back(static_cast<Index>(i), j);
            }
        }
    }
    return result;
}

}  // namespace udmis
