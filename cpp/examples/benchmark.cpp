#include <iostream>
#include <string>
#include <chrono>
#include <cmath>
#include <vector>
#include "udmis/udmis.hpp"

using namespace udmis;

int main(int argc, char** argv) {
    int num_steps = 10000000;
    int num_points = 200;
    if (argc > 1) {
        try {
            num_steps = std::stoi(argv[1]);
        } catch (...) {
            std::cerr << "Invalid step count, using default.\n";
        }
    }
    if (argc > 2) {
        try {
            num_points = std::stoi(argv[2]);
        } catch (...) {
            std::cerr << "Invalid point count, using default.\n";
        }
    }

    // Uniform points at a density of ~4 per unit area
    const double side = std::sqrt(static_cast<double>(num_points) / 4.0);
    const uint64_t seed = 42;
    RNG point_rng(seed);
    std::vector<Vec2> points;
    points.reserve(static_cast<size_t>(num_points));
    for (int i = 0; i < num_points; ++i) {
        points.emplace_back(point_rng.uniform(0.0, side), point_rng.uniform(0.0, side));
    }

    auto time_build = [&](const std::string& name, auto&& build) {
        auto start = std::chrono::high_resolution_clock::now();
        UnitDiskGraph graph = build(points, UNIT_DISK_RADIUS);
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        std::cout << "[" << name << "]\n";
        std::cout << "Edges:           " << graph.num_edges() << "\n";
        std::cout << "Time:            " << duration.count() / 1e3 << " ms\n\n";
    };
    time_build("build_edges", [](std::span<const Vec2> p, double r) { return build_edges(p, r); });
    time_build("build_edges_grid", [](std::span<const Vec2> p, double r) { return build_edges_grid(p, r); });

    AnnealingEngine engine(1.35, points, UNIT_DISK_RADIUS, seed);
    std::vector<double> temperatures = geometric_schedule(10.0, 0.01, num_steps);

    std::cout << "[Initial]\n";
    std::cout << "Energy:          " << engine.energy() << "\n";
    std::cout << "Violations:      " << engine.violations() << "\n";

    auto start = std::chrono::high_resolution_clock::now();
    for (double temperature : temperatures) {
        engine.metropolis_step(temperature);
    }
    auto end = std::chrono::high_resolution_clock::now();

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    double seconds = duration.count() / 1e6;
    double steps_per_sec = num_steps / seconds;

    std::cout << "\n[metropolis_step]\n";
    std::cout << "Steps:           " << num_steps << "\n";
    std::cout << "Time:            " << seconds << " s\n";
    std::cout << "Steps/sec:       " << steps_per_sec << "\n";
    std::cout << "Accept rate:     " << engine.accept_rate() << "\n";
    std::cout << "Final energy:    " << engine.energy() << " (recomputed " << engine.total_energy() << ")\n";
    std::cout << "Occupied:        " << engine.occupied_count() << "\n";
    std::cout << "Violations:      " << engine.violations() << "\n";

    return 0;
}
