#include "udmis/anneal/annealer.hpp"
#include "udmis/core/errors.hpp"
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace udmis {

namespace {

void validate_temperatures(std::span<const double> temperatures) {
    for (size_t k = 0; k < temperatures.size(); ++k) {
        double t = temperatures[k];
        if (std::isnan(t) || t < 0.0) {
            throw InvalidInputError(
                "anneal: temperature " + std::to_string(k) + " must be >= 0, got " + std::to_string(t)
            );
        }
    }
}

void record(
    AnnealResult& result,
    const AnnealingEngine& engine,
    const AnnealOptions& options,
    uint64_t step,
    double temperature
) {
    result.trace.push_back(EnergySample{step, temperature, engine.energy()});
    if (options.record_configurations) {
        result.snapshots.push_back(engine.configuration());
    }
    if (options.verbose) {
        std::cout << "[Annealer] step=" << std::setw(8) << step
                  << " temp=" << temperature
                  << " energy=" << engine.energy()
                  << " best=" << result.best_energy
                  << " acc-rate=" << engine.accept_rate() << "\n";
    }
}

}  // namespace

AnnealResult anneal(
    AnnealingEngine& engine,
    std::span<const double> temperatures,
    const AnnealOptions& options
) {
    if (options.sample_every <= 0) {
        throw InvalidInputError("anneal: sample_every must be positive, got " + std::to_string(options.sample_every));
    }
    validate_temperatures(temperatures);

    const size_t accepted0 = engine.accepted_count();
    const size_t rejected0 = engine.rejected_count();

    AnnealResult result;
    result.best_energy = engine.energy();
    result.best_configuration = engine.configuration();
    record(result, engine, options, 0, std::numeric_limits<double>::quiet_NaN());

    const uint64_t n = temperatures.size();
    const uint64_t every = static_cast<uint64_t>(options.sample_every);
    for (uint64_t step = 1; step <= n; ++step) {
        const double temperature = temperatures[step - 1];
        const double energy = engine.metropolis_step(temperature);

        if (energy < result.best_energy) {
            result.best_energy = energy;
            result.best_configuration = engine.configuration();
        }
        if (step % every == 0 || step == n) {
            record(result, engine, options, step, temperature);
        }
    }

    result.final_configuration = engine.configuration();
    result.final_energy = engine.energy();
    result.accepted = engine.accepted_count() - accepted0;
    result.rejected = engine.rejected_count() - rejected0;
    return result;
}

RestartsResult anneal_restarts(
    const GraphPtr& graph,
    const Hamiltonian& hamiltonian,
    std::span<const double> temperatures,
    int n_restarts,
    uint64_t seed,
    const AnnealOptions& options
) {
    if (n_restarts <= 0) {
        throw InvalidInputError("anneal_restarts: n_restarts must be positive, got " + std::to_string(n_restarts));
    }
    if (options.sample_every <= 0) {
        throw InvalidInputError("anneal_restarts: sample_every must be positive");
    }
    validate_temperatures(temperatures);

    // Engines and RNG streams are created sequentially for reproducibility
    RNG master(seed);
    std::vector<AnnealingEngine> engines;
    engines.reserve(static_cast<size_t>(n_restarts));
    for (int r = 0; r < n_restarts; ++r) {
        engines.emplace_back(graph, hamiltonian.clone(), master.split());
    }

    RestartsResult result;
    result.runs.resize(static_cast<size_t>(n_restarts));

    if (options.verbose) {
        int n_threads = 1;
        #ifdef _OPENMP
        n_threads = omp_get_max_threads();
        #endif
        std::cout << "[Annealer] " << n_restarts << " restarts x " << temperatures.size()
                  << " steps on " << n_threads << " thread(s)\n";
    }

    // Runs stay quiet inside the parallel region; errors must not escape it
    AnnealOptions run_options = options;
    run_options.verbose = false;
    std::vector<std::exception_ptr> errors(static_cast<size_t>(n_restarts));

    #ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (int r = 0; r < n_restarts; ++r) {
        const size_t idx = static_cast<size_t>(r);
        try {
            result.runs[idx] = anneal(engines[idx], temperatures, run_options);
        } catch (...) {
            errors[idx] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    for (size_t r = 1; r < result.runs.size(); ++r) {
        if (result.runs[r].best_energy < result.runs[result.best_index].best_energy) {
            result.best_index = r;
        }
    }

    if (options.verbose) {
        for (size_t r = 0; r < result.runs.size(); ++r) {
            const AnnealResult& run = result.runs[r];
            std::cout << "[Annealer] restart=" << r
                      << " final=" << run.final_energy
                      << " best=" << run.best_energy
                      << " accepted=" << run.accepted
                      << " rejected=" << run.rejected
                      << (r == result.best_index ? " *" : "") << "\n";
        }
    }
    return result;
}

}  // namespace udmis
