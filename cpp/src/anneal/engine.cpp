#include "udmis/anneal/engine.hpp"
#include "udmis/core/errors.hpp"
#include "udmis/hamiltonian/udmis_hamiltonian.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>

namespace udmis {

namespace {

GraphPtr build_graph(std::span<const Vec2> points, double radius) {
    if (points.empty()) {
        throw InvalidInputError("AnnealingEngine: point set is empty");
    }
    return std::make_shared<const UnitDiskGraph>(build_edges(points, radius));
}

}  // namespace

AnnealingEngine::AnnealingEngine(
    double u,
    std::span<const Vec2> points,
    double radius,
    uint64_t seed,
    bool verbose
)
    : AnnealingEngine(
        build_graph(points, radius),
        std::make_unique<UDMISHamiltonian>(u),
        RNG(seed),
        verbose
    )
{}

AnnealingEngine::AnnealingEngine(
    GraphPtr graph,
    HamiltonianPtr hamiltonian,
    uint64_t seed,
    bool verbose
)
    : AnnealingEngine(std::move(graph), std::move(hamiltonian), RNG(seed), verbose)
{}

AnnealingEngine::AnnealingEngine(
    GraphPtr graph,
    HamiltonianPtr hamiltonian,
    RNG rng,
    bool verbose
)
    : graph_(std::move(graph))
    , hamiltonian_(std::move(hamiltonian))
    , rng_(rng)
    , verbose_(verbose)
{
    if (!graph_ || graph_->empty()) {
        throw InvalidInputError("AnnealingEngine: graph must have at least one vertex");
    }
    if (!hamiltonian_) {
        throw InvalidInputError("AnnealingEngine: hamiltonian is null");
    }
    // Infinite-temperature start
    config_ = Configuration::init_random(graph_->size(), rng_);
    energy_ = total_energy();
}

double AnnealingEngine::total_energy() const {
    return hamiltonian_->total_energy(*graph_, config_);
}

double AnnealingEngine::energy_delta(Index i) const {
    return hamiltonian_->energy_delta(*graph_, config_, i);
}

Index AnnealingEngine::random_vertex() {
    return rng_.randint(0, static_cast<int>(graph_->size()) - 1);
}

double AnnealingEngine::metropolis_step(double temperature) {
    if (std::isnan(temperature) || temperature < 0.0) {
        throw InvalidInputError("metropolis_step: temperature must be >= 0, got " + std::to_string(temperature));
    }

    const Index i = random_vertex();
    const double delta = energy_delta(i);

    bool accept;
    double accept_prob;
    if (delta <= 0.0) {
        accept = true;
        accept_prob = 1.0;
    } else if (temperature == 0.0) {
        // Greedy descent: uphill moves are never taken
        accept = false;
        accept_prob = 0.0;
    } else {
        accept_prob = std::exp(-delta / temperature);
        accept = rng_.uniform() < accept_prob;
    }

    if (accept) {
        config_.flip(i);
        energy_ += delta;
        ++n_accepted_;
#ifndef NDEBUG
        check_energy_cache();
#endif
        note_move();
    } else {
        ++n_rejected_;
    }

    ++steps_;
    last_accept_ = accept;
    last_delta_ = delta;
    last_vertex_ = i;

    if (verbose_) {
        std::cout << "[AnnealingEngine] step=" << steps_ << " temp=" << temperature
                  << " i=" << i << " dE=" << delta << " prob=" << accept_prob
                  << (accept ? " accept" : " reject") << " energy=" << energy_ << "\n";
    }
    return energy_;
}

void AnnealingEngine::flip(Index i) {
    const double delta = energy_delta(i);
    config_.flip(i);
    energy_ += delta;
    note_move();
}

void AnnealingEngine::note_move() {
    // Bound rounding drift of the running sum
    if (++moves_since_resync_ >= graph_->size()) {
        resync_energy();
    }
}

void AnnealingEngine::set_configuration(const Configuration& config) {
    if (config.size() != graph_->size()) {
        throw InvalidInputError(
            "set_configuration: expected " + std::to_string(graph_->size()) +
            " vertices, got " + std::to_string(config.size())
        );
    }
    config_ = config;
    resync_energy();
}

void AnnealingEngine::randomize() {
    config_ = Configuration::init_random(graph_->size(), rng_);
    resync_energy();
}

double AnnealingEngine::resync_energy() {
    energy_ = total_energy();
    moves_since_resync_ = 0;
    return energy_;
}

void AnnealingEngine::check_energy_cache() const {
    const double expected = total_energy();
    const double tol = 1e-6 * (1.0 + std::abs(expected));
    if (std::abs(expected - energy_) > tol) {
        std::cerr << "[AnnealingEngine] ERROR: running energy " << energy_
                  << " does not match total energy " << expected
                  << " after step " << steps_ << " (vertex " << last_vertex_ << ")\n";
        assert(false && "Running energy out of sync");
    }
}

}  // namespace udmis
