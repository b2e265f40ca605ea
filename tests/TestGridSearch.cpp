#include "backtest/GridSearchOptimizer.h"
#include "common/Errors.h"
#include "TestCandles.h"

#include <algorithm>
#include <iostream>

using namespace exitforge;
using namespace exitforge::testing;

namespace {

strategy::StrategyConfig baseConfig() {
    strategy::StrategyConfig c;
    c.strategy_id = "grid-mr";
    c.entry_signal = "mean_reversion";
    c.exit_policy.stop_loss_pct = 8.0;
    c.exit_policy.take_profit_pct = 15.0;
    c.exit_policy.slippage_pct = 0.1;
    c.exit_policy.fee_pct = 0.1;
    return c;
}

backtest::GridSearchOptimizer makeOptimizer(size_t top_k = 5) {
    backtest::GridSearchSettings settings;
    settings.top_k = top_k;
    settings.worker_threads = 4;
    return backtest::GridSearchOptimizer(backtest::SimulationSettings(), backtest::AggregationSettings(), settings);
}

backtest::GridSearchSpace smallSpace() {
    backtest::GridSearchSpace space;
    space.stop_loss_pct = {0.0, 5.0, 8.0};
    space.take_profit_pct = {0.0, 15.0};
    space.trailing_stop_pct = {0.0, 2.0};
    space.max_hold_candles = {0, 48};
    return space;
}

int testRejectsBadSpaces() {
    const auto optimizer = makeOptimizer();
    const std::vector<InstrumentSeries> series = {makeSeries("OSC", oscillatingTrend(400))};

    auto empty = smallSpace();
    empty.trailing_stop_pct.clear();
    bool thrown = false;
    try {
        optimizer.optimize(baseConfig(), series, empty);
    } catch (const InvalidConfigurationError&) {
        thrown = true;
    }
    TEST_CHECK(thrown);

    auto oversized = smallSpace();
    oversized.stop_loss_pct = {1, 2, 3, 4, 5, 6, 7};
    thrown = false;
    try {
        optimizer.optimize(baseConfig(), series, oversized);
    } catch (const InvalidConfigurationError&) {
        thrown = true;
    }
    TEST_CHECK(thrown);
    return 0;
}

int testScore() {
    const auto optimizer = makeOptimizer();
    backtest::BacktestResult r;
    r.total_trades = 30;
    r.expectancy = 2.0;
    TEST_NEAR(optimizer.score(r), 1.0, 1e-12);

    r.total_trades = 0;
    TEST_NEAR(optimizer.score(r), 0.0, 1e-12);
    return 0;
}

int testRanking() {
    const auto optimizer = makeOptimizer(5);
    const std::vector<InstrumentSeries> series = {makeSeries("OSC", oscillatingTrend(1000))};
    const auto space = smallSpace();

    const auto report = optimizer.optimize(baseConfig(), series, space);

    TEST_CHECK(report.combinations == 24);
    // SL 0 and TP 0 together: 2 trail x 2 hold
    TEST_CHECK(report.skipped_invalid == 4);

    const size_t rankable = report.combinations - report.skipped_invalid - report.below_min_trades;
    TEST_CHECK(!report.top.empty());
    TEST_CHECK(report.top.size() == std::min<size_t>(5, rankable));

    for (size_t i = 1; i < report.top.size(); ++i) {
        const auto& prev = report.top[i - 1];
        const auto& cur = report.top[i];
        TEST_CHECK(prev.score >= cur.score);
        if (prev.score == cur.score) {
            TEST_CHECK(prev.result.profit_factor >= cur.result.profit_factor);
            if (prev.result.profit_factor == cur.result.profit_factor) {
                TEST_CHECK(prev.sweep_index < cur.sweep_index);
            }
        }
    }

    for (const auto& c : report.top) {
        TEST_CHECK(c.result.total_trades >= 10);
        TEST_CHECK(c.exit_policy.isValid());
        TEST_NEAR(c.exit_policy.fee_pct, 0.1, 1e-12);
        // Sweep index decodes back to the policy: SL outermost, hold innermost
        const size_t hold_i = c.sweep_index % 2;
        const size_t trail_i = (c.sweep_index / 2) % 2;
        const size_t tp_i = (c.sweep_index / 4) % 2;
        const size_t sl_i = c.sweep_index / 8;
        TEST_CHECK(c.exit_policy.max_hold_candles == space.max_hold_candles[hold_i]);
        TEST_CHECK(c.exit_policy.trailing_stop_pct == space.trailing_stop_pct[trail_i]);
        TEST_CHECK(c.exit_policy.take_profit_pct == space.take_profit_pct[tp_i]);
        TEST_CHECK(c.exit_policy.stop_loss_pct == space.stop_loss_pct[sl_i]);
    }

    // Same inputs, same ranking
    const auto again = optimizer.optimize(baseConfig(), series, space);
    TEST_CHECK(again.top.size() == report.top.size());
    for (size_t i = 0; i < report.top.size(); ++i) {
        TEST_CHECK(again.top[i].sweep_index == report.top[i].sweep_index);
    }
    return 0;
}

} // namespace

int main() {
    if (testRejectsBadSpaces() != 0) return 1;
    if (testScore() != 0) return 1;
    if (testRanking() != 0) return 1;

    std::cout << "[TEST] GridSearch PASSED\n";
    return 0;
}
