#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "udmis/anneal/schedule.hpp"
#include "udmis/core/errors.hpp"
#include <cmath>
#include <limits>

using namespace udmis;
using Catch::Approx;

TEST_CASE("Geometric schedule", "[schedule]") {
    SECTION("Endpoints and constant ratio") {
        auto temps = geometric_schedule(100.0, 0.01, 5);
        REQUIRE(temps.size() == 5);
        REQUIRE(temps.front() == 100.0);
        REQUIRE(temps.back() == 0.01);
        REQUIRE(temps[1] == Approx(10.0));
        REQUIRE(temps[2] == Approx(1.0));
        REQUIRE(temps[3] == Approx(0.1));
    }

    SECTION("Monotone non-increasing") {
        auto temps = geometric_schedule(5.0, 0.05, 1000);
        for (size_t k = 1; k < temps.size(); ++k) {
            REQUIRE(temps[k] <= temps[k - 1]);
        }
    }

    SECTION("Degenerate lengths") {
        REQUIRE(geometric_schedule(1.0, 0.1, 0).empty());
        auto one = geometric_schedule(1.0, 0.1, 1);
        REQUIRE(one.size() == 1);
        REQUIRE(one[0] == 1.0);
        auto flat = geometric_schedule(0.5, 0.5, 3);
        REQUIRE(flat[1] == Approx(0.5));
    }

    SECTION("Invalid bounds") {
        REQUIRE_THROWS_AS(geometric_schedule(1.0, 0.0, 10), InvalidInputError);
        REQUIRE_THROWS_AS(geometric_schedule(-1.0, -2.0, 10), InvalidInputError);
        REQUIRE_THROWS_AS(geometric_schedule(0.1, 1.0, 10), InvalidInputError);
        REQUIRE_THROWS_AS(geometric_schedule(1.0, 0.1, -1), InvalidInputError);
        REQUIRE_THROWS_AS(
            geometric_schedule(std::numeric_limits<double>::infinity(), 0.1, 10),
            InvalidInputError
        );
    }
}

TEST_CASE("Linear schedule", "[schedule]") {
    auto temps = linear_schedule(1.0, 0.0, 5);
    REQUIRE(temps.size() == 5);
    REQUIRE(temps[0] == 1.0);
    REQUIRE(temps[1] == Approx(0.75));
    REQUIRE(temps[2] == Approx(0.5));
    REQUIRE(temps[4] == 0.0);

    REQUIRE_THROWS_AS(linear_schedule(1.0, -0.5, 5), InvalidInputError);
    REQUIRE_THROWS_AS(linear_schedule(1.0, 2.0, 5), InvalidInputError);
}

TEST_CASE("Logarithmic schedule", "[schedule]") {
    auto temps = logarithmic_schedule(2.0, 0.5, 200);
    REQUIRE(temps.size() == 200);
    REQUIRE(temps[0] == Approx(2.0));
    REQUIRE(temps[5] == Approx(2.0 / std::log(5.0 + std::exp(1.0))));
    for (size_t k = 1; k < temps.size(); ++k) {
        REQUIRE(temps[k] <= temps[k - 1]);
        REQUIRE(temps[k] >= 0.5);
    }
    REQUIRE(temps.back() == 0.5);
}

TEST_CASE("make_schedule dispatch", "[schedule]") {
    REQUIRE(make_schedule(CoolingSchedule::Exponential, 10.0, 0.1, 7) == geometric_schedule(10.0, 0.1, 7));
    REQUIRE(make_schedule(CoolingSchedule::Linear, 10.0, 0.1, 7) == linear_schedule(10.0, 0.1, 7));
    REQUIRE(make_schedule(CoolingSchedule::Logarithmic, 10.0, 0.1, 7) == logarithmic_schedule(10.0, 0.1, 7));
}
