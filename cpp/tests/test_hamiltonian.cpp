#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "udmis/hamiltonian/udmis_hamiltonian.hpp"
#include "udmis/core/errors.hpp"
#include <limits>
#include <stdexcept>
#include <vector>

using namespace udmis;
using Catch::Approx;

static std::vector<Vec2> triangle_points() {
    return {Vec2(0.0, 0.0), Vec2(0.5, 0.0), Vec2(0.25, 0.4)};
}

TEST_CASE("UDMISHamiltonian construction", "[hamiltonian]") {
    REQUIRE(UDMISHamiltonian(2.0).u() == 2.0);
    REQUIRE_THROWS_AS(UDMISHamiltonian(0.0), InvalidInputError);
    REQUIRE_THROWS_AS(UDMISHamiltonian(-1.0), InvalidInputError);
    REQUIRE_THROWS_AS(UDMISHamiltonian(std::numeric_limits<double>::infinity()), InvalidInputError);
    REQUIRE_THROWS_AS(UDMISHamiltonian(std::numeric_limits<double>::quiet_NaN()), InvalidInputError);

    UDMISHamiltonian h(1.5);
    HamiltonianPtr copy = h.clone();
    auto* typed = dynamic_cast<UDMISHamiltonian*>(copy.get());
    REQUIRE(typed != nullptr);
    REQUIRE(typed->u() == 1.5);
}

TEST_CASE("UDMISHamiltonian total energy", "[hamiltonian]") {
    auto points = triangle_points();
    UnitDiskGraph graph = build_edges(points);
    UDMISHamiltonian h(2.0);

    SECTION("All occupied triangle") {
        // 3 occupied edges * u - 3 occupied vertices
        REQUIRE(h.total_energy(graph, Configuration(3, true)) == Approx(3.0));
    }

    SECTION("Empty configuration") {
        REQUIRE(h.total_energy(graph, Configuration(3)) == Approx(0.0));
    }

    SECTION("Single occupied vertex is the optimum") {
        REQUIRE(h.total_energy(graph, Configuration::from_bitstring("010")) == Approx(-1.0));
    }

    SECTION("Two occupied vertices") {
        REQUIRE(h.total_energy(graph, Configuration::from_bitstring("110")) == Approx(0.0));
    }

    SECTION("Disconnected points earn one per vertex") {
        std::vector<Vec2> far = {Vec2(0.0, 0.0), Vec2(3.0, 0.0)};
        UnitDiskGraph g = build_edges(far);
        REQUIRE(h.total_energy(g, Configuration(2, true)) == Approx(-2.0));
    }
}

TEST_CASE("UDMISHamiltonian energy delta", "[hamiltonian]") {
    auto points = triangle_points();
    UnitDiskGraph graph = build_edges(points);
    UDMISHamiltonian h(2.0);

    SECTION("Occupied vertex: 1 - u k") {
        Configuration config(3, true);
        // k = 2 occupied neighbors
        REQUIRE(h.energy_delta(graph, config, 0) == Approx(1.0 - 2.0 * 2));
        config = Configuration::from_bitstring("100");
        // k = 0
        REQUIRE(h.energy_delta(graph, config, 0) == Approx(1.0));
    }

    SECTION("Unoccupied vertex: u k - 1") {
        Configuration config = Configuration::from_bitstring("011");
        // k = 2
        REQUIRE(h.energy_delta(graph, config, 0) == Approx(2.0 * 2 - 1.0));
        config = Configuration::from_bitstring("010");
        // k = 1
        REQUIRE(h.energy_delta(graph, config, 0) == Approx(1.0));
        config = Configuration(3);
        REQUIRE(h.energy_delta(graph, config, 0) == Approx(-1.0));
    }

    SECTION("Single vertex graph gives +-1") {
        std::vector<Vec2> one = {Vec2(0.0, 0.0)};
        UnitDiskGraph g = build_edges(one);
        REQUIRE(h.energy_delta(g, Configuration(1, true), 0) == Approx(1.0));
        REQUIRE(h.energy_delta(g, Configuration(1, false), 0) == Approx(-1.0));
    }

    SECTION("Out-of-range index throws") {
        REQUIRE_THROWS_AS(h.energy_delta(graph, Configuration(3), 3), std::out_of_range);
        REQUIRE_THROWS_AS(h.energy_delta(graph, Configuration(3), -1), std::out_of_range);
    }

    SECTION("Configuration size must match the graph") {
        Configuration shorter(2, true);
        Configuration longer(5, true);
        REQUIRE_THROWS_AS(h.total_energy(graph, shorter), InvalidInputError);
        REQUIRE_THROWS_AS(h.total_energy(graph, longer), InvalidInputError);
        REQUIRE_THROWS_AS(h.energy_delta(graph, shorter, 0), InvalidInputError);
        REQUIRE_THROWS_AS(h.energy_delta(graph, longer, 0), InvalidInputError);
    }
}

TEST_CASE("Energy delta agrees with total energy", "[hamiltonian]") {
    RNG rng(2024);
    std::vector<Vec2> points;
    for (int i = 0; i < 40; ++i) {
        points.emplace_back(rng.uniform(0.0, 3.0), rng.uniform(0.0, 3.0));
    }
    UnitDiskGraph graph = build_edges(points);

    for (double u : {0.5, 1.35, 2.0, 7.25}) {
        UDMISHamiltonian h(u);
        Configuration config = Configuration::init_random(graph.size(), rng);
        double energy = h.total_energy(graph, config);

        int on_to_off = 0;
        int off_to_on = 0;
        for (int step = 0; step < 500; ++step) {
            Index i = rng.randint(0, static_cast<int>(graph.size()) - 1);
            if (config[i]) ++on_to_off; else ++off_to_on;

            double delta = h.energy_delta(graph, config, i);
            config.flip(i);
            double after = h.total_energy(graph, config);
            REQUIRE(after == Approx(energy + delta).margin(1e-9));
            energy = after;
        }
        // Both flip directions were exercised
        REQUIRE(on_to_off > 0);
        REQUIRE(off_to_on > 0);
    }
}
