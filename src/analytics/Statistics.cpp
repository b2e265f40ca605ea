#include "analytics/Statistics.h"
#include <algorithm>
#include <cmath>

namespace exitforge {
namespace analytics {

double Statistics::clamp(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

double Statistics::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / values.size();
}

double Statistics::sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / (values.size() - 1));
}

ConfidenceInterval Statistics::wilsonInterval(int wins, int total, double z) {
    ConfidenceInterval ci;
    if (total <= 0) {
        ci.lower = 0.0;
        ci.upper = 1.0;
        return ci;
    }

    const double n = static_cast<double>(total);
    const double p = static_cast<double>(wins) / n;
    const double z2 = z * z;
    const double denom = 1.0 + z2 / n;
    const double center = (p + z2 / (2.0 * n)) / denom;
    const double half = z * std::sqrt(p * (1.0 - p) / n + z2 / (4.0 * n * n)) / denom;

    ci.lower = clamp(center - half, 0.0, 1.0);
    ci.upper = clamp(center + half, 0.0, 1.0);

    // Pin the exact edges, the interval stays non-degenerate on the other side
    if (wins <= 0) ci.lower = 0.0;
    if (wins >= total) ci.upper = 1.0;
    return ci;
}

ConfidenceInterval Statistics::meanInterval(const std::vector<double>& values, double z) {
    ConfidenceInterval ci;
    if (values.empty()) return ci;

    const double m = mean(values);
    const double se = sampleStdDev(values) / std::sqrt(static_cast<double>(values.size()));
    ci.lower = m - z * se;
    ci.upper = m + z * se;
    return ci;
}

double Statistics::sharpeLike(const std::vector<double>& values, double cap) {
    if (values.empty()) return 0.0;
    const double sd = std::max(sampleStdDev(values), kStdEpsilon);
    const double sr = mean(values) / sd * std::sqrt(static_cast<double>(values.size()));
    return clamp(sr, -cap, cap);
}

ConfidenceInterval Statistics::sharpeInterval(const std::vector<double>& values, double z, double cap) {
    ConfidenceInterval ci;
    if (values.empty()) return ci;

    const double n = static_cast<double>(values.size());
    const double sd = std::max(sampleStdDev(values), kStdEpsilon);
    const double sr = mean(values) / sd;
    const double se = std::sqrt((1.0 + sr * sr / 2.0) / n);
    const double scale = std::sqrt(n);

    ci.lower = clamp((sr - z * se) * scale, -cap, cap);
    ci.upper = clamp((sr + z * se) * scale, -cap, cap);
    return ci;
}

double Statistics::ewmaVolatility(const std::vector<double>& values, double decay) {
    if (values.empty()) return 0.0;
    double var = values.front() * values.front();
    for (size_t i = 1; i < values.size(); ++i) {
        var = decay * var + (1.0 - decay) * values[i] * values[i];
    }
    return std::sqrt(var);
}

} // namespace analytics
} // namespace exitforge
