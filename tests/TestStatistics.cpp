#include "analytics/Statistics.h"
#include "TestCandles.h"

#include <cmath>
#include <iostream>

using namespace exitforge;
using analytics::Statistics;

int main() {
    std::cout << "[TEST] Starting Statistics Test..." << std::endl;

    // Wilson never collapses to a point at the edges
    const auto none = Statistics::wilsonInterval(0, 100);
    TEST_CHECK(none.lower == 0.0);
    TEST_CHECK(none.upper > 0.0);
    TEST_CHECK(none.upper < 0.05);

    const auto all = Statistics::wilsonInterval(100, 100);
    TEST_CHECK(all.lower < 1.0);
    TEST_CHECK(all.lower > 0.95);
    TEST_CHECK(all.upper == 1.0);

    const auto half = Statistics::wilsonInterval(50, 100);
    TEST_NEAR(half.lower, 0.4038, 1e-3);
    TEST_NEAR(half.upper, 0.5962, 1e-3);

    const auto empty = Statistics::wilsonInterval(0, 0);
    TEST_CHECK(empty.lower == 0.0 && empty.upper == 1.0);

    // Moments
    TEST_NEAR(Statistics::mean({1.0, 2.0, 3.0}), 2.0, 1e-12);
    TEST_NEAR(Statistics::sampleStdDev({1.0, 2.0, 3.0}), 1.0, 1e-12);
    TEST_NEAR(Statistics::sampleStdDev({5.0}), 0.0, 1e-12);

    const auto mean_ci = Statistics::meanInterval({1.0, 2.0, 3.0});
    TEST_NEAR(mean_ci.lower, 2.0 - 1.96 / std::sqrt(3.0), 1e-12);
    TEST_NEAR(mean_ci.upper, 2.0 + 1.96 / std::sqrt(3.0), 1e-12);

    // Zero variance hits the std floor, then the cap
    TEST_NEAR(Statistics::sharpeLike({1.0, 1.0, 1.0, 1.0}), 10.0, 1e-12);
    TEST_NEAR(Statistics::sharpeLike({-1.0, -1.0, -1.0}), -10.0, 1e-12);
    TEST_NEAR(Statistics::sharpeLike({}), 0.0, 1e-12);

    // mean 1, sd 2, n 4: SR = 0.5 per trade, 1.0 scaled
    const std::vector<double> r = {3.0, -1.0, 3.0, -1.0};
    const double sd = Statistics::sampleStdDev(r);
    TEST_NEAR(Statistics::sharpeLike(r), 1.0 / sd * 2.0, 1e-12);

    const auto sharpe_ci = Statistics::sharpeInterval(r);
    TEST_CHECK(sharpe_ci.lower < Statistics::sharpeLike(r));
    TEST_CHECK(sharpe_ci.upper > Statistics::sharpeLike(r));
    TEST_CHECK(sharpe_ci.lower >= -10.0 && sharpe_ci.upper <= 10.0);

    // EWMA of squared values
    TEST_NEAR(Statistics::ewmaVolatility({0.1}), 0.1, 1e-12);
    TEST_NEAR(Statistics::ewmaVolatility({0.0, 0.0, 1.0}, 0.9), std::sqrt(0.1), 1e-12);
    TEST_NEAR(Statistics::ewmaVolatility({}), 0.0, 1e-12);

    std::cout << "[TEST] Statistics PASSED" << std::endl;
    return 0;
}
