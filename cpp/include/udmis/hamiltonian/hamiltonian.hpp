#pragma once

#include "../core/configuration.hpp"
#include "../core/graph.hpp"
#include <memory>

namespace udmis {

class Hamiltonian;

// Unique pointer alias for energy models
using HamiltonianPtr = std::unique_ptr<Hamiltonian>;

// Energy model over an occupation configuration on a graph.
// The engine only needs these two capabilities; any model that can
// report a total energy and a single-flip delta can drive it.
class Hamiltonian {
public:
    virtual ~Hamiltonian() = default;

    // Energy of the whole configuration
    [[nodiscard]] virtual double total_energy(
        const UnitDiskGraph& graph,
        const Configuration& config
    ) const = 0;

    // Change of total_energy() if vertex i were flipped.
    // Must satisfy E(flip_i(c)) == E(c) + energy_delta(c, i).
    [[nodiscard]] virtual double energy_delta(
        const UnitDiskGraph& graph,
        const Configuration& config,
        Index i
    ) const = 0;

    // Clone (deep copy)
    [[nodiscard]] virtual HamiltonianPtr clone() const = 0;
};

}  // namespace udmis
