#pragma once

#include "common/Types.h"
#include "analytics/Statistics.h"
#include "risk/ExitRules.h"
#include "strategy/ExitPolicy.h"

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace exitforge {
namespace backtest {

// One closed synthetic position. Prices are fills (slippage applied).
struct TradeRecord {
    std::string instrument;
    TimestampMs entry_time = 0;
    TimestampMs exit_time = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double pnl_pct = 0.0;               // gross, at the quoted exit level
    double pnl_net = 0.0;               // after exit slippage and both fees
    double log_return = 0.0;            // ln(exit fill / entry fill)
    risk::ExitReason exit_reason = risk::ExitReason::NONE;
    int hold_candles = 0;               // entry candle counts as 1
    double high_water_mark_pct = 0.0;
    double low_water_mark_pct = 0.0;
    double max_drawdown_pct = 0.0;      // peak to trough inside the trade
};

// Output of one simulator pass over one instrument series
struct SimulationRun {
    std::string instrument;
    std::string interval;
    size_t total_candles = 0;
    TimestampMs data_start = 0;
    TimestampMs data_end = 0;
    double parkinson_volatility = 0.0;

    bool insufficient_data = false;
    std::string insufficiency_reason;

    std::vector<TradeRecord> trades;
};

struct BacktestResult {
    std::string strategy_id;
    strategy::ExitPolicy exit_policy;

    int total_trades = 0;
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;
    double profit_factor = 0.0;
    double gross_win = 0.0;
    double gross_loss = 0.0;            // absolute value
    double expectancy = 0.0;            // mean pnl_net, percent
    double best_trade = 0.0;
    double worst_trade = 0.0;
    double max_drawdown_pct = 0.0;      // compounded equity curve
    double sharpe_like = 0.0;
    double avg_hold_candles = 0.0;

    analytics::ConfidenceInterval win_rate_ci95;
    analytics::ConfidenceInterval avg_return_ci95;
    analytics::ConfidenceInterval sharpe_ci95;
    bool clt_reliable = false;

    double ewma_volatility = 0.0;
    double log_return_std = 0.0;
    double volatility_ratio = 0.0;
    bool volatility_regime_shift = false;

    std::vector<double> equity_curve;
    std::map<std::string, int> exit_reason_counts;
    std::vector<std::string> insufficient_instruments;
    int instruments = 0;
    TimestampMs data_start = 0;
    TimestampMs data_end = 0;
    std::string win_rate_display;

    // Merged ledger in exit order
    std::vector<TradeRecord> trades;
};

nlohmann::json toJson(const TradeRecord& trade);
// Summary without the trade ledger
nlohmann::json toJson(const BacktestResult& result);

} // namespace backtest
} // namespace exitforge
