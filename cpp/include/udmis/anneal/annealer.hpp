#pragma once

#include "engine.hpp"
#include "../core/configuration.hpp"
#include "../hamiltonian/hamiltonian.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace udmis {

// Sampling and logging options for a driven anneal
struct AnnealOptions {
    int sample_every{1};                 // record every k-th step (and the last one)
    bool record_configurations{false};   // keep a snapshot with each sample
    bool verbose{false};                 // print one line per sample
};

struct EnergySample {
    uint64_t step{0};        // steps taken so far; 0 is the initial state
    double temperature{0.0}; // temperature of the step just taken (NaN at step 0)
    double energy{0.0};
};

struct AnnealResult {
    Configuration final_configuration;
    double final_energy{0.0};
    Configuration best_configuration;
    double best_energy{0.0};
    std::vector<EnergySample> trace;
    std::vector<Configuration> snapshots;  // aligned with trace when recorded
    size_t accepted{0};
    size_t rejected{0};
};

// Drive `engine` with one metropolis_step per temperature.
// Temperatures are validated up front; nothing is stepped if any is
// negative or NaN.
AnnealResult anneal(
    AnnealingEngine& engine,
    std::span<const double> temperatures,
    const AnnealOptions& options = {}
);

struct RestartsResult {
    std::vector<AnnealResult> runs;
    size_t best_index{0};

    [[nodiscard]] const AnnealResult& best() const { return runs[best_index]; }
};

// Independent anneals over one shared graph. Restart r uses the r-th RNG
// split from `seed`, so results do not depend on the thread count.
// Runs in parallel when built with OpenMP. With options.verbose one summary
// line per restart is printed after all runs finish. The first exception
// raised by any run is rethrown to the caller.
RestartsResult anneal_restarts(
    const GraphPtr& graph,
    const Hamiltonian& hamiltonian,
    std::span<const double> temperatures,
    int n_restarts,
    uint64_t seed = 42,
    const AnnealOptions& options = {}
);

}  // namespace udmis
