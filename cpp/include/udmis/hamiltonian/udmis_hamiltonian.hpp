#pragma once

#include "hamiltonian.hpp"

namespace udmis {

// UD-MIS Hamiltonian
//
//   E = u * sum_{i<j, i~j} n_i n_j  -  sum_i n_i
//
// Each occupied edge costs u, each occupied vertex earns 1. For u > 1 the
// ground states are exactly the maximum independent sets, with E = -|MIS|.
class UDMISHamiltonian : public Hamiltonian {
public:
    // Throws InvalidInputError unless u is finite and positive
    explicit UDMISHamiltonian(double u);

    [[nodiscard]] double total_energy(
        const UnitDiskGraph& graph,
        const Configuration& config
    ) const override;

    // With k occupied neighbors of i: (1 - 2 n_i) * (u k - 1).
    // O(degree(i)).
    [[nodiscard]] double energy_delta(
        const UnitDiskGraph& graph,
        const Configuration& config,
        Index i
    ) const override;

    [[nodiscard]] HamiltonianPtr clone() const override;

    [[nodiscard]] double u() const { return u_; }

    // Occupied neighbors of vertex i
    [[nodiscard]] static int occupied_neighbors(
        const UnitDiskGraph& graph,
        const Configuration& config,
        Index i
    );

private:
    double u_;
};

}  // namespace udmis
