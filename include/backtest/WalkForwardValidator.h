#pragma once

#include "backtest/ResultAggregator.h"
#include "backtest/TradeSimulator.h"
#include "strategy/StrategyConfig.h"

#include <string>
#include <vector>

namespace exitforge {
namespace backtest {

struct WalkForwardSettings {
    double split_ratio = 0.7;
    double overfit_profit_factor_ratio = 0.75;
    double robust_win_rate_delta = 0.15;
    int min_oos_trades = 5;
    size_t worker_threads = 0;
};

struct WalkForwardReport {
    std::string strategy_id;
    BacktestResult in_sample;
    BacktestResult out_of_sample;
    std::vector<SimulationRun> in_sample_runs;
    std::vector<SimulationRun> out_of_sample_runs;
    // The exact halves each side was simulated on
    std::vector<InstrumentSeries> in_sample_inputs;
    std::vector<InstrumentSeries> out_of_sample_inputs;
    bool overfit = false;
    bool robust = false;
    std::string verdict;
};

struct WalkForwardFold {
    int index = 0;
    BacktestResult train;
    BacktestResult test;
};

// Chronological in-sample / out-of-sample split. Never shuffles.
class WalkForwardValidator {
public:
    WalkForwardValidator(const SimulationSettings& simulation,
                         const AggregationSettings& aggregation,
                         const WalkForwardSettings& settings);

    // Splits every series at split_ratio, simulates each side independently and
    // aggregates each side across instruments.
    WalkForwardReport validate(const strategy::StrategyConfig& config,
                               const std::vector<InstrumentSeries>& series) const;

    // Expanding-window folds: series cut into folds + 1 segments, fold k trains
    // on segments [0..k] and tests on segment k + 1.
    std::vector<WalkForwardFold> validateFolds(const strategy::StrategyConfig& config,
                                               const std::vector<InstrumentSeries>& series,
                                               int folds) const;

    const WalkForwardSettings& settings() const { return settings_; }

private:
    TradeSimulator simulator_;
    ResultAggregator aggregator_;
    WalkForwardSettings settings_;

    static InstrumentSeries slice(const InstrumentSeries& series, size_t begin, size_t end);

    // Simulates each (series, window) job in parallel, results in job order
    std::vector<SimulationRun> simulateAll(const strategy::StrategyConfig& config,
                                           const std::vector<InstrumentSeries>& jobs) const;

    void classify(WalkForwardReport& report) const;
};

} // namespace backtest
} // namespace exitforge
