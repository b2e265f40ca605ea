#pragma once

#include "backtest/BacktestResult.h"
#include <string>
#include <vector>

namespace exitforge {
namespace backtest {

struct AggregationSettings {
    size_t equity_curve_points = 200;
    int clt_min_trades = 50;
    double ewma_decay = 0.9;
    double regime_shift_ratio = 1.5;
    double profit_factor_cap = 999.0;
    double sharpe_cap = 10.0;
    double z = 1.96;
};

// Merges per-instrument ledgers into one strategy-level result.
// Trades are merged then ordered by (exit_time, entry_time, instrument), so
// aggregating {A, B} equals aggregating the union of their trades.
class ResultAggregator {
public:
    explicit ResultAggregator(const AggregationSettings& settings = AggregationSettings());

    BacktestResult aggregate(const std::string& strategy_id,
                             const strategy::ExitPolicy& policy,
                             const std::vector<SimulationRun>& runs) const;

    BacktestResult aggregateTrades(const std::string& strategy_id,
                                   const strategy::ExitPolicy& policy,
                                   std::vector<TradeRecord> trades) const;

private:
    AggregationSettings settings_;

    void computeEquity(BacktestResult& result) const;
    void computeVolatility(BacktestResult& result) const;
    static std::string formatWinRate(double win_rate, const analytics::ConfidenceInterval& ci);
};

} // namespace backtest
} // namespace exitforge
