#include "udmis/hamiltonian/udmis_hamiltonian.hpp"
#include "udmis/core/errors.hpp"
#include <cmath>
#include <string>

namespace udmis {

UDMISHamiltonian::UDMISHamiltonian(double u) : u_(u) {
    if (!std::isfinite(u) || u <= 0.0) {
        throw InvalidInputError("UDMISHamiltonian: u must be finite and positive, got " + std::to_string(u));
    }
}

int UDMISHamiltonian::occupied_neighbors(
    const UnitDiskGraph& graph,
    const Configuration& config,
    Index i
) {
    int k = 0;
    for (Index j : graph.neighbors(i)) {
        if (config[j]) ++k;
    }
    return k;
}

double UDMISHamiltonian::total_energy(
    const UnitDiskGraph& graph,
    const Configuration& config
) const {
    check_sizes(graph, config);
    const Index n = static_cast<Index>(graph.size());
    int pairs = 0;
    int occupied = 0;
    for (Index i = 0; i < n; ++i) {
        if (!config[i]) continue;
        ++occupied;
        for (Index j : graph.neighbors(i)) {
            if (j > i && config[j]) ++pairs;
        }
    }
    return u_ * static_cast<double>(pairs) - static_cast<double>(occupied);
}

double UDMISHamiltonian::energy_delta(
    const UnitDiskGraph& graph,
    const Configuration& config,
    Index i
) const {
    check_sizes(graph, config);
    graph.check_index(i);
    const int k = occupied_neighbors(graph, config, i);
    // +1 when turning on, -1 when turning off
    const double sign = config[i] ? -1.0 : 1.0;
    return sign * (u_ * static_cast<double>(k) - 1.0);
}

HamiltonianPtr UDMISHamiltonian::clone() const {
    return std::make_unique<UDMISHamiltonian>(u_);
}

}  // namespace udmis
