#include "udmis/spatial/cell_grid.hpp"
#include "udmis/core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace udmis {

CellGrid CellGrid::init(const std::vector<Vec2>& points, double min_cell_size) {
    if (!(min_cell_size > 0.0) || !std::isfinite(min_cell_size)) {
        throw InvalidInputError("CellGrid: cell size must be finite and positive");
    }

    CellGrid grid;
    grid.size_ = min_cell_size;
    grid.k2ij_.assign(points.size() * 2, -1);

    AABB bounds = AABB::of(points);
    if (bounds.empty()) {
        grid.nx_ = 1;
        grid.ny_ = 1;
        grid.cell_start_.assign(static_cast<size_t>(3 * 3 + 1), 0);
        return grid;
    }

    // Keep the cell count proportional to the number of points
    Vec2 extent = bounds.size();
    if (!extent.is_finite()) {
        throw InvalidInputError("CellGrid: point spread overflows double precision");
    }
    double max_cells_per_dim = 2.0 * std::ceil(std::sqrt(static_cast<double>(points.size()))) + 1.0;
    double longest = std::max(extent.x, extent.y);
    // Slack keeps pairs at exactly min_cell_size apart within adjacent cells
    grid.size_ = std::max(min_cell_size * (1.0 + 1e-9), longest / max_cells_per_dim);

    grid.origin_ = bounds.min;
    grid.nx_ = static_cast<int>(std::floor(extent.x / grid.size_)) + 1;
    grid.ny_ = static_cast<int>(std::floor(extent.y / grid.size_)) + 1;

    const size_t n_cells = static_cast<size_t>(grid.nx_ + 2) * static_cast<size_t>(grid.ny_ + 2);

    // Counting sort of items into cells
    std::vector<int> counts(n_cells, 0);
    for (size_t k = 0; k < points.size(); ++k) {
        auto [i, j] = grid.compute_ij(points[k]);
        grid.k2ij_[k * 2 + 0] = i;
        grid.k2ij_[k * 2 + 1] = j;
        ++counts[static_cast<size_t>(grid.cell_index(i, j))];
    }

    grid.cell_start_.assign(n_cells + 1, 0);
    for (size_t c = 0; c < n_cells; ++c) {
        grid.cell_start_[c + 1] = grid.cell_start_[c] + counts[c];
    }

    grid.cell_items_.resize(points.size());
    std::vector<int> fill(grid.cell_start_.begin(), grid.cell_start_.end() - 1);
    for (size_t k = 0; k < points.size(); ++k) {
        int c = grid.cell_index(grid.k2ij_[k * 2], grid.k2ij_[k * 2 + 1]);
        grid.cell_items_[static_cast<size_t>(fill[static_cast<size_t>(c)]++)] = static_cast<Index>(k);
    }

    return grid;
}

std::pair<int, int> CellGrid::compute_ij(const Vec2& pos) const {
    int i = static_cast<int>(std::floor((pos.x - origin_.x) / size_)) + 1;
    int j = static_cast<int>(std::floor((pos.y - origin_.y) / size_)) + 1;
    // Clamp into the unpadded range
    i = std::clamp(i, 1, nx_);
    j = std::clamp(j, 1, ny_);
    return {i, j};
}

int CellGrid::cell_count(int i, int j) const {
    int c = cell_index(i, j);
    return cell_start_[static_cast<size_t>(c) + 1] - cell_start_[static_cast<size_t>(c)];
}

std::vector<Index> CellGrid::get_items_in_cell(int i, int j) const {
    int c = cell_index(i, j);
    return std::vector<Index>(
        cell_items_.begin() + cell_start_[static_cast<size_t>(c)],
        cell_items_.begin() + cell_start_[static_cast<size_t>(c) + 1]
    );
}

std::vector<Index> CellGrid::get_candidates(Index k) const {
    std::vector<Index> out;
    get_candidates(k, out);
    return out;
}

void CellGrid::get_candidates(Index k, std::vector<Index>& out) const {
    out.clear();
    auto [ci, cj] = get_item_cell(k);
    for (const auto& [di, dj] : NEIGHBOR_DELTAS) {
        int c = cell_index(ci + di, cj + dj);
        for (int s = cell_start_[static_cast<size_t>(c)]; s < cell_start_[static_cast<size_t>(c) + 1]; ++s) {
            out.push_back(cell_items_[static_cast<size_t>(s)]);
        }
    }
}

}  // namespace udmis
