#pragma once

#include "../core/types.hpp"
#include <array>
#include <utility>
#include <vector>

namespace udmis {

// 9-neighborhood deltas for candidate search
constexpr std::array<std::pair<int, int>, 9> NEIGHBOR_DELTAS = {{
    {0, -1}, {-1, -1}, {+1, -1},
    {0, 0},  {-1, 0},  {+1, 0},
    {0, +1}, {-1, +1}, {+1, +1}
}};

// Static uniform grid over a point set for fixed-radius neighbor queries.
// Cells are at least `min_cell_size` wide, so every point within that
// distance of item k lies in the 3x3 neighborhood of k's cell.
// Uses one ring of padding cells to avoid boundary checks.
class CellGrid {
public:
    CellGrid() = default;

    // Bucket the points; cell size is min_cell_size, widened when the
    // bounding box would need more than ~4 cells per point. Throws
    // InvalidInputError when the bounding box extent is not representable.
    static CellGrid init(const std::vector<Vec2>& points, double min_cell_size);

    // Candidate indices in the 3x3 neighborhood of item k (includes k)
    [[nodiscard]] std::vector<Index> get_candidates(Index k) const;
    void get_candidates(Index k, std::vector<Index>& out) const;

    // Item indices in a cell
    [[nodiscard]] std::vector<Index> get_items_in_cell(int i, int j) const;

    [[nodiscard]] int cell_count(int i, int j) const;

    // Cell indices for a position (padded coordinates)
    [[nodiscard]] std::pair<int, int> compute_ij(const Vec2& pos) const;

    [[nodiscard]] std::pair<int, int> get_item_cell(Index k) const {
        return {k2ij_[static_cast<size_t>(k) * 2], k2ij_[static_cast<size_t>(k) * 2 + 1]};
    }

    [[nodiscard]] int grid_nx() const { return nx_; }
    [[nodiscard]] int grid_ny() const { return ny_; }
    [[nodiscard]] double cell_size() const { return size_; }
    [[nodiscard]] size_t num_items() const { return k2ij_.size() / 2; }

private:
    int nx_{0};          // Cells along x, without padding
    int ny_{0};          // Cells along y, without padding
    double size_{1.0};   // Cell size
    Vec2 origin_;        // Lower-left corner of the first unpadded cell

    // cell_start_[c] .. cell_start_[c + 1] indexes cell_items_ for cell c = i * (ny + 2) + j
    std::vector<int> cell_start_;
    std::vector<Index> cell_items_;
    // k2ij[k * 2 + 0] = i, k2ij[k * 2 + 1] = j
    std::vector<int> k2ij_;

    [[nodiscard]] int cell_index(int i, int j) const {
        return i * (ny_ + 2) + j;
    }
};

}  // namespace udmis
