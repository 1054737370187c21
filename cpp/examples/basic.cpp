#include <iostream>
#include <iomanip>
#include <string>
#include "udmis/udmis.hpp"

using namespace udmis;

int main(int argc, char** argv) {
    int num_steps = 20000;
    if (argc > 1) {
        try {
            num_steps = std::stoi(argv[1]);
        } catch (...) {
            std::cerr << "Invalid step count, using default.\n";
        }
    }

    std::cout << "UD-MIS Simulated Annealing Example\n";
    std::cout << "==================================\n\n";

    // Small unit-disk instance: a 3x4 lattice with spacing 0.9, so
    // horizontal and vertical neighbors interact, diagonals do not.
    std::vector<Vec2> points;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 4; ++j) {
            points.emplace_back(0.9 * i, 0.9 * j);
        }
    }

    const double u = 1.35;
    const uint64_t seed = 42;

    AnnealingEngine engine(u, points, UNIT_DISK_RADIUS, seed);
    const UnitDiskGraph& graph = engine.graph();

    std::cout << "Graph:\n";
    std::cout << "  Vertices: " << graph.size() << "\n";
    std::cout << "  Edges:    " << graph.num_edges() << "\n\n";

    std::cout << "Initial configuration: " << engine.configuration().to_bitstring() << "\n";
    std::cout << "  Energy:     " << engine.total_energy() << "\n";
    std::cout << "  Violations: " << engine.violations() << "\n\n";

    // Geometric cooling from T_i = 100 to T_f = 0.01
    std::vector<double> temperatures = geometric_schedule(100.0, 0.01, num_steps);

    AnnealOptions options;
    options.sample_every = num_steps / 10 > 0 ? num_steps / 10 : 1;
    options.verbose = true;

    std::cout << "Running " << num_steps << " Metropolis steps...\n";
    std::cout << std::fixed << std::setprecision(4);
    AnnealResult result = anneal(engine, temperatures, options);

    std::cout << "\nAnneal complete!\n";
    std::cout << "  Final configuration: " << result.final_configuration.to_bitstring() << "\n";
    std::cout << "  Final energy:        " << result.final_energy << "\n";
    std::cout << "  Best energy:         " << result.best_energy << "\n";
    std::cout << "  Occupied:            " << result.final_configuration.count_occupied() << "\n";
    std::cout << "  Independent set:     "
              << (is_independent_set(graph, result.final_configuration) ? "yes" : "no") << "\n";
    std::cout << "  Accept rate:         " << engine.accept_rate() << "\n";

    return 0;
}
