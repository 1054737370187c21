#include "udmis/anneal/schedule.hpp"
#include "udmis/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace udmis {

namespace {

void check_bounds(const char* name, double t_initial, double t_final, int n, bool strictly_positive) {
    const std::string prefix = std::string(name) + ": ";
    if (n < 0) {
        throw InvalidInputError(prefix + "number of steps must be >= 0, got " + std::to_string(n));
    }
    if (!std::isfinite(t_initial) || !std::isfinite(t_final)) {
        throw InvalidInputError(prefix + "temperatures must be finite");
    }
    if (strictly_positive ? (t_final <= 0.0) : (t_final < 0.0)) {
        throw InvalidInputError(prefix + "final temperature out of range: " + std::to_string(t_final));
    }
    if (t_final > t_initial) {
        throw InvalidInputError(
            prefix + "final temperature " + std::to_string(t_final) +
            " exceeds initial temperature " + std::to_string(t_initial)
        );
    }
}

}  // namespace

std::vector<double> geometric_schedule(double t_initial, double t_final, int n) {
    check_bounds("geometric_schedule", t_initial, t_final, n, true);

    std::vector<double> temps(static_cast<size_t>(n));
    if (n == 0) return temps;
    temps[0] = t_initial;
    if (n == 1) return temps;

    const double log_ratio = std::log(t_final / t_initial);
    for (int k = 1; k < n - 1; ++k) {
        double frac = static_cast<double>(k) / static_cast<double>(n - 1);
        temps[static_cast<size_t>(k)] = t_initial * std::exp(frac * log_ratio);
    }
    temps[static_cast<size_t>(n - 1)] = t_final;
    return temps;
}

std::vector<double> linear_schedule(double t_initial, double t_final, int n) {
    check_bounds("linear_schedule", t_initial, t_final, n, false);

    std::vector<double> temps(static_cast<size_t>(n));
    if (n == 0) return temps;
    temps[0] = t_initial;
    if (n == 1) return temps;

    const double step = (t_initial - t_final) / static_cast<double>(n - 1);
    for (int k = 1; k < n - 1; ++k) {
        temps[static_cast<size_t>(k)] = t_initial - step * static_cast<double>(k);
    }
    temps[static_cast<size_t>(n - 1)] = t_final;
    return temps;
}

std::vector<double> logarithmic_schedule(double t_initial, double t_final, int n) {
    check_bounds("logarithmic_schedule", t_initial, t_final, n, false);

    std::vector<double> temps(static_cast<size_t>(n));
    for (int k = 0; k < n; ++k) {
        double temp = t_initial / std::log(static_cast<double>(k) + std::exp(1.0));
        temps[static_cast<size_t>(k)] = std::max(temp, t_final);
    }
    return temps;
}

std::vector<double> make_schedule(
    CoolingSchedule schedule,
    double t_initial,
    double t_final,
    int n
) {
    switch (schedule) {
        case CoolingSchedule::Exponential:
            return geometric_schedule(t_initial, t_final, n);
        case CoolingSchedule::Linear:
            return linear_schedule(t_initial, t_final, n);
        case CoolingSchedule::Logarithmic:
            return logarithmic_schedule(t_initial, t_final, n);
    }
    throw InvalidInputError("make_schedule: unknown cooling schedule");
}

}  // namespace udmis
