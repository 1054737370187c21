#include <catch2/catch_test_macros.hpp>
#include "udmis/core/graph.hpp"
#include "udmis/core/errors.hpp"
#include "udmis/spatial/cell_grid.hpp"
#include "udmis/random/rng.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace udmis;

static std::vector<Vec2> random_points(int n, double side, uint64_t seed) {
    RNG rng(seed);
    std::vector<Vec2> points;
    for (int i = 0; i < n; ++i) {
        points.emplace_back(rng.uniform(0.0, side), rng.uniform(0.0, side));
    }
    return points;
}

TEST_CASE("Unit-disk adjacency", "[graph]") {
    SECTION("Triangle within the radius is complete") {
        std::vector<Vec2> points = {Vec2(0.0, 0.0), Vec2(0.5, 0.0), Vec2(0.25, 0.4)};
        UnitDiskGraph graph = build_edges(points);
        REQUIRE(graph.size() == 3);
        REQUIRE(graph.num_edges() == 3);
        REQUIRE(graph.adjacent(0, 1));
        REQUIRE(graph.adjacent(1, 2));
        REQUIRE(graph.adjacent(0, 2));
    }

    SECTION("Distance exactly equal to the radius is an edge") {
        std::vector<Vec2> points = {Vec2(0.0, 0.0), Vec2(1.0, 0.0), Vec2(2.5, 0.0)};
        UnitDiskGraph graph = build_edges(points, 1.0);
        REQUIRE(graph.adjacent(0, 1));
        REQUIRE_FALSE(graph.adjacent(1, 2));
        REQUIRE_FALSE(graph.adjacent(0, 2));
        REQUIRE(graph.num_edges() == 1);
    }

    SECTION("Radius is honoured") {
        std::vector<Vec2> points = {Vec2(0.0, 0.0), Vec2(1.5, 0.0)};
        REQUIRE(build_edges(points, 1.0).num_edges() == 0);
        REQUIRE(build_edges(points, 2.0).num_edges() == 1);
    }

    SECTION("Symmetric and irreflexive for random point sets") {
        for (uint64_t seed = 1; seed <= 5; ++seed) {
            auto points = random_points(40, 4.0, seed);
            UnitDiskGraph graph = build_edges(points);
            for (Index i = 0; i < 40; ++i) {
                REQUIRE_FALSE(graph.adjacent(i, i));
                for (Index j = 0; j < 40; ++j) {
                    REQUIRE(graph.adjacent(i, j) == graph.adjacent(j, i));
                    if (i != j) {
                        bool close = points[static_cast<size_t>(i)].distance(points[static_cast<size_t>(j)]) <= 1.0;
                        REQUIRE(graph.adjacent(i, j) == close);
                    }
                }
            }
        }
    }

    SECTION("Neighbor lists are sorted and match degrees") {
        auto points = random_points(30, 3.0, 11);
        UnitDiskGraph graph = build_edges(points);
        size_t degree_sum = 0;
        for (Index i = 0; i < 30; ++i) {
            auto nbrs = graph.neighbors(i);
            REQUIRE(std::is_sorted(nbrs.begin(), nbrs.end()));
            REQUIRE(static_cast<int>(nbrs.size()) == graph.degree(i));
            REQUIRE(graph.degree(i) <= graph.max_degree());
            degree_sum += nbrs.size();
        }
        REQUIRE(degree_sum == 2 * graph.num_edges());

        auto edges = graph.edges();
        REQUIRE(edges.size() == graph.num_edges());
        for (const auto& [i, j] : edges) {
            REQUIRE(i < j);
            REQUIRE(graph.adjacent(i, j));
        }
    }
}

TEST_CASE("Unit-disk graph boundaries", "[graph]") {
    SECTION("Empty point set") {
        std::vector<Vec2> points;
        UnitDiskGraph graph = build_edges(points);
        REQUIRE(graph.empty());
        REQUIRE(graph.num_edges() == 0);
        REQUIRE(graph.edges().empty());
    }

    SECTION("Single point has no edges") {
        std::vector<Vec2> points = {Vec2(0.3, 0.7)};
        UnitDiskGraph graph = build_edges(points);
        REQUIRE(graph.size() == 1);
        REQUIRE(graph.num_edges() == 0);
        REQUIRE(graph.degree(0) == 0);
        REQUIRE_FALSE(graph.adjacent(0, 0));
    }

    SECTION("Coincident points are adjacent") {
        std::vector<Vec2> points = {Vec2(1.0, 1.0), Vec2(1.0, 1.0)};
        UnitDiskGraph graph = build_edges(points);
        REQUIRE(graph.adjacent(0, 1));
    }

    SECTION("Out-of-range index throws") {
        std::vector<Vec2> points = {Vec2(0.0, 0.0), Vec2(0.5, 0.0)};
        UnitDiskGraph graph = build_edges(points);
        REQUIRE_THROWS_AS(graph.adjacent(0, 2), std::out_of_range);
        REQUIRE_THROWS_AS(graph.adjacent(-1, 0), std::out_of_range);
        REQUIRE_THROWS_AS(graph.point(5), std::out_of_range);
    }

    SECTION("Invalid radius or coordinates are rejected") {
        std::vector<Vec2> points = {Vec2(0.0, 0.0), Vec2(0.5, 0.0)};
        REQUIRE_THROWS_AS(build_edges(points, 0.0), InvalidInputError);
        REQUIRE_THROWS_AS(build_edges(points, -1.0), InvalidInputError);
        REQUIRE_THROWS_AS(build_edges(points, std::numeric_limits<double>::quiet_NaN()), InvalidInputError);

        std::vector<Vec2> bad = {Vec2(0.0, std::numeric_limits<double>::infinity())};
        REQUIRE_THROWS_AS(build_edges(bad), InvalidInputError);
        REQUIRE_THROWS_AS(build_edges_grid(bad), InvalidInputError);
    }
}

TEST_CASE("Gridded builder matches brute force", "[graph][grid]") {
    SECTION("Random point sets at several densities") {
        for (uint64_t seed = 1; seed <= 4; ++seed) {
            for (double side : {1.0, 3.0, 10.0}) {
                auto points = random_points(120, side, seed);
                UnitDiskGraph brute = build_edges(points);
                UnitDiskGraph gridded = build_edges_grid(points);
                REQUIRE(gridded.size() == brute.size());
                REQUIRE(gridded.edges() == brute.edges());
            }
        }
    }

    SECTION("Lattice with pairs exactly at the radius") {
        std::vector<Vec2> points;
        for (int i = 0; i < 6; ++i) {
            for (int j = 0; j < 6; ++j) {
                points.emplace_back(static_cast<double>(i), static_cast<double>(j));
            }
        }
        UnitDiskGraph brute = build_edges(points);
        UnitDiskGraph gridded = build_edges_grid(points);
        // 2 * 6 * 5 axis-aligned unit edges, no diagonals
        REQUIRE(brute.num_edges() == 60);
        REQUIRE(gridded.edges() == brute.edges());
    }

    SECTION("Sparse spread keeps the grid small") {
        std::vector<Vec2> points = {Vec2(0.0, 0.0), Vec2(1.0e6, 1.0e6), Vec2(0.5, 0.0)};
        UnitDiskGraph gridded = build_edges_grid(points);
        REQUIRE(gridded.num_edges() == 1);
        REQUIRE(gridded.adjacent(0, 2));
    }

    SECTION("Spread beyond double range matches brute force") {
        std::vector<Vec2> points = {Vec2(-1.0e308, 0.0), Vec2(1.0e308, 0.0), Vec2(0.0, 0.0), Vec2(0.5, 0.0)};
        UnitDiskGraph gridded = build_edges_grid(points);
        UnitDiskGraph brute = build_edges(points);
        REQUIRE(gridded.edges() == brute.edges());
        REQUIRE(gridded.num_edges() == 1);
        REQUIRE(gridded.adjacent(2, 3));
        REQUIRE_THROWS_AS(CellGrid::init(points, 1.0), InvalidInputError);
    }
}

TEST_CASE("CellGrid candidates", "[grid]") {
    SECTION("Candidates include the item and its close neighbors") {
        std::vector<Vec2> points = {Vec2(0.0, 0.0), Vec2(0.9, 0.0), Vec2(5.0, 5.0)};
        CellGrid grid = CellGrid::init(points, 1.0);
        REQUIRE(grid.num_items() == 3);
        REQUIRE(grid.cell_size() >= 1.0);

        auto candidates = grid.get_candidates(0);
        REQUIRE(std::find(candidates.begin(), candidates.end(), 0) != candidates.end());
        REQUIRE(std::find(candidates.begin(), candidates.end(), 1) != candidates.end());
        REQUIRE(std::find(candidates.begin(), candidates.end(), 2) == candidates.end());
    }

    SECTION("Every item lands in exactly one cell") {
        auto points = random_points(50, 5.0, 3);
        CellGrid grid = CellGrid::init(points, 1.0);
        int total = 0;
        for (int i = 1; i <= grid.grid_nx(); ++i) {
            for (int j = 1; j <= grid.grid_ny(); ++j) {
                total += grid.cell_count(i, j);
                for (Index k : grid.get_items_in_cell(i, j)) {
                    REQUIRE(grid.get_item_cell(k) == std::make_pair(i, j));
                }
            }
        }
        REQUIRE(total == 50);
    }

    SECTION("Invalid cell size") {
        std::vector<Vec2> points = {Vec2(0.0, 0.0)};
        REQUIRE_THROWS_AS(CellGrid::init(points, 0.0), InvalidInputError);
    }
}
