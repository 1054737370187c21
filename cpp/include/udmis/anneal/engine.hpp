#pragma once

#include "../core/configuration.hpp"
#include "../core/graph.hpp"
#include "../hamiltonian/hamiltonian.hpp"
#include "../random/rng.hpp"
#include <cstdint>
#include <span>

namespace udmis {

// Single-spin-flip Metropolis engine.
//
// Owns the configuration, an energy model and its own RNG; the graph is
// shared read-only. The engine has no schedule: the caller supplies one
// temperature per metropolis_step(). Every step boundary is a valid
// stopping point. Not thread-safe; use one engine per thread.
class AnnealingEngine {
public:
    // Builds the unit-disk graph of `points` and a UD-MIS Hamiltonian with
    // interaction strength u. Throws InvalidInputError for empty points or
    // a non-finite / non-positive u.
    AnnealingEngine(
        double u,
        std::span<const Vec2> points,
        double radius = UNIT_DISK_RADIUS,
        uint64_t seed = 42,
        bool verbose = false
    );

    // Any energy model over a prebuilt graph
    AnnealingEngine(
        GraphPtr graph,
        HamiltonianPtr hamiltonian,
        RNG rng,
        bool verbose = false
    );

    AnnealingEngine(
        GraphPtr graph,
        HamiltonianPtr hamiltonian,
        uint64_t seed = 42,
        bool verbose = false
    );

    AnnealingEngine(AnnealingEngine&&) noexcept = default;
    AnnealingEngine& operator=(AnnealingEngine&&) noexcept = default;

    // Energy recomputed from scratch
    [[nodiscard]] double total_energy() const;

    // Running energy kept up to date by accepted moves. It is recomputed
    // from scratch every size() accepted moves, so it differs from
    // total_energy() by at most the rounding of that many additions.
    [[nodiscard]] double energy() const { return energy_; }

    // Energy change if vertex i were flipped (std::out_of_range if invalid)
    [[nodiscard]] double energy_delta(Index i) const;

    // Uniform vertex in [0, size())
    [[nodiscard]] Index random_vertex();

    // One Metropolis trial at the given temperature; returns the energy
    // after the (possibly rejected) move.
    // temperature == 0 accepts only non-increasing moves.
    // Throws InvalidInputError for negative or NaN temperatures.
    double metropolis_step(double temperature);

    // Unconditional flip, keeping the running energy consistent
    void flip(Index i);

    // Replace the configuration (size must match the graph)
    void set_configuration(const Configuration& config);

    // Fresh Bernoulli(0.5) configuration from the engine's RNG
    void randomize();

    // Recompute the running energy from scratch and return it
    double resync_energy();

    [[nodiscard]] const Configuration& configuration() const { return config_; }
    [[nodiscard]] bool occupation(Index i) const { return config_.occupied(i); }
    [[nodiscard]] size_t size() const { return graph_->size(); }

    [[nodiscard]] const UnitDiskGraph& graph() const { return *graph_; }
    [[nodiscard]] const Hamiltonian& hamiltonian() const { return *hamiltonian_; }
    [[nodiscard]] const RNG& rng() const { return rng_; }

    [[nodiscard]] int violations() const { return count_violations(*graph_, config_); }
    [[nodiscard]] int occupied_count() const { return config_.count_occupied(); }
    [[nodiscard]] bool is_independent_set() const { return violations() == 0; }

    [[nodiscard]] float accept_rate() const {
        float total = static_cast<float>(n_accepted_ + n_rejected_);
        return total > 0.0f ? static_cast<float>(n_accepted_) / total : 0.0f;
    }
    [[nodiscard]] size_t accepted_count() const { return n_accepted_; }
    [[nodiscard]] size_t rejected_count() const { return n_rejected_; }
    [[nodiscard]] uint64_t steps() const { return steps_; }
    [[nodiscard]] bool last_accept() const { return last_accept_; }
    [[nodiscard]] double last_delta() const { return last_delta_; }
    [[nodiscard]] Index last_vertex() const { return last_vertex_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    GraphPtr graph_;
    HamiltonianPtr hamiltonian_;
    RNG rng_;
    Configuration config_;
    bool verbose_;

    double energy_{0.0};
    uint64_t steps_{0};
    size_t n_accepted_{0};
    size_t n_rejected_{0};
    bool last_accept_{false};
    double last_delta_{0.0};
    Index last_vertex_{-1};
    size_t moves_since_resync_{0};

    void note_move();
    void check_energy_cache() const;
};

}  // namespace udmis
