#include "backtest/ResultAggregator.h"
#include "analytics/Statistics.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace exitforge {
namespace backtest {

using analytics::Statistics;

ResultAggregator::ResultAggregator(const AggregationSettings& settings)
    : settings_(settings) {
}

BacktestResult ResultAggregator::aggregate(const std::string& strategy_id,
                                           const strategy::ExitPolicy& policy,
                                           const std::vector<SimulationRun>& runs) const {
    std::vector<TradeRecord> merged;
    std::vector<std::string> insufficient;
    TimestampMs data_start = 0;
    TimestampMs data_end = 0;
    bool has_range = false;
    int instruments = 0;

    for (const auto& run : runs) {
        ++instruments;
        if (run.insufficient_data) {
            insufficient.push_back(run.instrument);
        }
        if (run.total_candles > 0) {
            if (!has_range || run.data_start < data_start) data_start = run.data_start;
            if (!has_range || run.data_end > data_end) data_end = run.data_end;
            has_range = true;
        }
        merged.insert(merged.end(), run.trades.begin(), run.trades.end());
    }

    BacktestResult result = aggregateTrades(strategy_id, policy, std::move(merged));
    std::sort(insufficient.begin(), insufficient.end());
    result.insufficient_instruments = insufficient;
    result.instruments = instruments;
    result.data_start = data_start;
    result.data_end = data_end;
    return result;
}

BacktestResult ResultAggregator::aggregateTrades(const std::string& strategy_id,
                                                 const strategy::ExitPolicy& policy,
                                                 std::vector<TradeRecord> trades) const {
    std::stable_sort(trades.begin(), trades.end(), [](const TradeRecord& a, const TradeRecord& b) {
        if (a.exit_time != b.exit_time) return a.exit_time < b.exit_time;
        if (a.entry_time != b.entry_time) return a.entry_time < b.entry_time;
        return a.instrument < b.instrument;
    });

    BacktestResult result;
    result.strategy_id = strategy_id;
    result.exit_policy = policy;
    result.trades = std::move(trades);
    result.total_trades = static_cast<int>(result.trades.size());

    std::vector<double> returns;
    returns.reserve(result.trades.size());
    double hold_sum = 0.0;

    for (const auto& t : result.trades) {
        returns.push_back(t.pnl_net);
        hold_sum += t.hold_candles;
        result.exit_reason_counts[risk::toString(t.exit_reason)]++;

        if (t.pnl_net > 0.0) {
            result.wins++;
            result.gross_win += t.pnl_net;
        } else {
            result.losses++;
            result.gross_loss += -t.pnl_net;
        }
    }

    if (result.total_trades > 0) {
        result.win_rate = static_cast<double>(result.wins) / result.total_trades;
        result.expectancy = Statistics::mean(returns);
        result.best_trade = *std::max_element(returns.begin(), returns.end());
        result.worst_trade = *std::min_element(returns.begin(), returns.end());
        result.avg_hold_candles = hold_sum / result.total_trades;
    }

    // Finite sentinel keeps downstream ranking well-defined
    if (result.gross_loss > 1e-12) {
        result.profit_factor = std::min(settings_.profit_factor_cap, result.gross_win / result.gross_loss);
    } else {
        result.profit_factor = result.wins > 0 ? settings_.profit_factor_cap : 0.0;
    }

    result.sharpe_like = Statistics::sharpeLike(returns, settings_.sharpe_cap);
    result.win_rate_ci95 = Statistics::wilsonInterval(result.wins, result.total_trades, settings_.z);
    result.avg_return_ci95 = Statistics::meanInterval(returns, settings_.z);
    result.sharpe_ci95 = Statistics::sharpeInterval(returns, settings_.z, settings_.sharpe_cap);
    result.clt_reliable = result.total_trades >= settings_.clt_min_trades;
    result.win_rate_display = formatWinRate(result.win_rate, result.win_rate_ci95);

    if (!result.trades.empty()) {
        result.data_start = result.trades.front().entry_time;
        result.data_end = result.trades.back().exit_time;
    }

    computeEquity(result);
    computeVolatility(result);
    return result;
}

void ResultAggregator::computeEquity(BacktestResult& result) const {
    std::vector<double> curve;
    curve.reserve(result.trades.size() + 1);

    double equity = 100.0;
    double peak = equity;
    double max_dd = 0.0;
    curve.push_back(equity);

    for (const auto& t : result.trades) {
        equity = std::max(0.0, equity * (1.0 + t.pnl_net / 100.0));
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - equity) / peak * 100.0);
        }
        curve.push_back(equity);
    }
    result.max_drawdown_pct = max_dd;

    const size_t points = settings_.equity_curve_points;
    if (points >= 2 && curve.size() > points) {
        std::vector<double> sampled;
        sampled.reserve(points);
        const double step = static_cast<double>(curve.size() - 1) / (points - 1);
        for (size_t k = 0; k < points; ++k) {
            const size_t idx = static_cast<size_t>(std::llround(k * step));
            sampled.push_back(curve[std::min(idx, curve.size() - 1)]);
        }
        curve.swap(sampled);
    }
    result.equity_curve = std::move(curve);
}

void ResultAggregator::computeVolatility(BacktestResult& result) const {
    std::vector<double> log_returns;
    log_returns.reserve(result.trades.size());
    for (const auto& t : result.trades) {
        log_returns.push_back(t.log_return);
    }

    result.ewma_volatility = Statistics::ewmaVolatility(log_returns, settings_.ewma_decay);
    result.log_return_std = Statistics::sampleStdDev(log_returns);
    result.volatility_ratio = result.log_return_std > 0.0
        ? result.ewma_volatility / result.log_return_std
        : 0.0;
    result.volatility_regime_shift = result.volatility_ratio > settings_.regime_shift_ratio;
}

std::string ResultAggregator::formatWinRate(double win_rate, const analytics::ConfidenceInterval& ci) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0)
        << win_rate * 100.0 << "% ["
        << ci.lower * 100.0 << "-" << ci.upper * 100.0 << "%]";
    return oss.str();
}

} // namespace backtest
} // namespace exitforge
