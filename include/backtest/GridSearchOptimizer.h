#pragma once

#include "backtest/ResultAggregator.h"
#include "backtest/TradeSimulator.h"
#include "strategy/StrategyConfig.h"

#include <vector>

namespace exitforge {
namespace backtest {

struct GridSearchSpace {
    std::vector<double> stop_loss_pct;
    std::vector<double> take_profit_pct;
    std::vector<double> trailing_stop_pct;
    std::vector<int> max_hold_candles;

    size_t combinations() const {
        return stop_loss_pct.size() * take_profit_pct.size() *
               trailing_stop_pct.size() * max_hold_candles.size();
    }
};

struct GridSearchSettings {
    size_t top_k = 10;
    int min_trades = 10;
    double confidence_half_trades = 30.0;
    size_t max_stop_loss_values = 6;
    size_t max_take_profit_values = 7;
    size_t max_trailing_values = 6;
    size_t max_hold_values = 6;
    size_t worker_threads = 0;
};

struct GridCandidate {
    size_t sweep_index = 0;
    strategy::ExitPolicy exit_policy;
    BacktestResult result;
    double score = 0.0;
};

struct GridSearchReport {
    std::string strategy_id;
    size_t combinations = 0;
    size_t skipped_invalid = 0;
    size_t below_min_trades = 0;
    std::vector<GridCandidate> top;
};

// Sweeps SL x TP x trail x hold and ranks by expectancy weighted by trade count.
class GridSearchOptimizer {
public:
    GridSearchOptimizer(const SimulationSettings& simulation,
                        const AggregationSettings& aggregation,
                        const GridSearchSettings& settings);

    // Slippage and fee come from base.exit_policy.
    // Throws InvalidConfigurationError for an empty or oversized dimension.
    GridSearchReport optimize(const strategy::StrategyConfig& base,
                              const std::vector<InstrumentSeries>& series,
                              const GridSearchSpace& space) const;

    // expectancy * n / (n + confidence_half_trades)
    double score(const BacktestResult& result) const;

private:
    TradeSimulator simulator_;
    ResultAggregator aggregator_;
    GridSearchSettings settings_;

    void checkSpace(const GridSearchSpace& space) const;
};

} // namespace backtest
} // namespace exitforge
