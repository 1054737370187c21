#pragma once

#include <vector>

namespace udmis {

// Cooling schedule type
enum class CoolingSchedule {
    Exponential,  // geometric interpolation t_initial -> t_final
    Linear,       // evenly spaced t_initial -> t_final
    Logarithmic   // t_initial / log(k + e), floored at t_final
};

// n temperatures t_i * (t_f / t_i)^(k / (n - 1)), k = 0..n-1.
// Both ends must be finite and positive with t_final <= t_initial.
[[nodiscard]] std::vector<double> geometric_schedule(double t_initial, double t_final, int n);

// n evenly spaced temperatures from t_initial down to t_final (t_final may be 0)
[[nodiscard]] std::vector<double> linear_schedule(double t_initial, double t_final, int n);

// n temperatures t_initial / log(k + e), never below t_final
[[nodiscard]] std::vector<double> logarithmic_schedule(double t_initial, double t_final, int n);

[[nodiscard]] std::vector<double> make_schedule(
    CoolingSchedule schedule,
    double t_initial,
    double t_final,
    int n
);

}  // namespace udmis
