#pragma once

#include <vector>

namespace exitforge {
namespace analytics {

struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;
};

class Statistics {
public:
    static double mean(const std::vector<double>& values);

    // Bessel-corrected, 0 below two samples
    static double sampleStdDev(const std::vector<double>& values);

    // Wilson score interval for a binomial proportion, clamped to [0, 1].
    // total == 0 yields [0, 1].
    static ConfidenceInterval wilsonInterval(int wins, int total, double z = 1.96);

    // mean +/- z * std / sqrt(n)
    static ConfidenceInterval meanInterval(const std::vector<double>& values, double z = 1.96);

    // (mean / max(std, epsilon)) * sqrt(n), clamped to [-cap, cap]
    static double sharpeLike(const std::vector<double>& values, double cap = 10.0);

    // Asymptotic standard error of the per-trade Sharpe ratio, scaled like sharpeLike()
    static ConfidenceInterval sharpeInterval(const std::vector<double>& values,
                                             double z = 1.96, double cap = 10.0);

    // sqrt of the EWMA of squared values
    static double ewmaVolatility(const std::vector<double>& values, double decay = 0.9);

    static constexpr double kStdEpsilon = 1e-3;

private:
    static double clamp(double v, double lo, double hi);
};

} // namespace analytics
} // namespace exitforge
