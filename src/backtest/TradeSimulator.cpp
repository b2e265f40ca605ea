#include "backtest/TradeSimulator.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace exitforge {
namespace backtest {

TradeSimulator::TradeSimulator(const SimulationSettings& settings)
    : settings_(settings) {
}

SimulationRun TradeSimulator::run(const std::vector<Candle>& candles,
                                  const strategy::IEntrySignal& signal,
                                  const strategy::ExitPolicy& policy) const {
    InstrumentSeries series;
    series.candles = candles;
    return run(series, signal, policy);
}

SimulationRun TradeSimulator::run(const InstrumentSeries& series,
                                  const strategy::IEntrySignal& signal,
                                  const strategy::ExitPolicy& policy) const {
    policy.validate();

    const auto& candles = series.candles;
    SimulationRun result;
    result.instrument = series.instrument;
    result.interval = series.interval;
    result.total_candles = candles.size();
    if (!candles.empty()) {
        result.data_start = candles.front().timestamp;
        result.data_end = candles.back().timestamp;
    }

    if (candles.size() < settings_.min_candles) {
        result.insufficient_data = true;
        result.insufficiency_reason = "insufficient data: " + std::to_string(candles.size()) +
                                      " candles, need " + std::to_string(settings_.min_candles);
        LOG_WARN("[{}] {} - skipping simulation", series.instrument, result.insufficiency_reason);
        return result;
    }

    result.parkinson_volatility = analytics::TechnicalIndicators::parkinsonVolatility(candles);

    size_t i = signal.lookback();
    // A signal on the last candle has no next open to fill at
    while (i + 1 < candles.size()) {
        if (!signal.shouldEnter(candles, i)) {
            ++i;
            continue;
        }

        TradeRecord trade;
        trade.instrument = series.instrument;
        const size_t exit_index = simulatePosition(candles, i + 1, policy, trade);
        result.trades.push_back(trade);
        i = exit_index + 1;
    }

    return result;
}

size_t TradeSimulator::simulatePosition(const std::vector<Candle>& candles,
                                        size_t entry_index,
                                        const strategy::ExitPolicy& policy,
                                        TradeRecord& trade) const {
    const double slip = policy.slippage_pct / 100.0;
    const double entry_fill = candles[entry_index].open * (1.0 + slip);

    trade.entry_time = candles[entry_index].timestamp;
    trade.entry_price = entry_fill;

    double hwm = 0.0;
    double lwm = 0.0;
    double max_dd = 0.0;
    risk::ExitReason reason = risk::ExitReason::NONE;
    double quote = 0.0;
    size_t j = entry_index;

    for (; j < candles.size(); ++j) {
        const Candle& c = candles[j];
        const double best = (c.high - entry_fill) / entry_fill * 100.0;
        const double worst = (c.low - entry_fill) / entry_fill * 100.0;

        hwm = std::max(hwm, best);
        lwm = std::min(lwm, worst);
        max_dd = std::max(max_dd, hwm - worst);

        const int hold = static_cast<int>(j - entry_index) + 1;

        risk::ExitObservation observed;
        observed.best_pnl_pct = best;
        observed.worst_pnl_pct = worst;
        observed.high_water_mark_pct = hwm;
        observed.hold_expired = policy.max_hold_candles > 0 && hold >= policy.max_hold_candles;

        reason = risk::evaluateExit(policy, observed);
        if (reason != risk::ExitReason::NONE) {
            quote = risk::exitQuotePrice(policy, reason, entry_fill, hwm, c.close);
            break;
        }
    }

    // Still open on the final candle: close at the last close
    if (reason == risk::ExitReason::NONE) {
        j = candles.size() - 1;
        reason = risk::ExitReason::EXPIRED;
        quote = candles[j].close;
    }

    const double exit_fill = quote * (1.0 - slip);

    trade.exit_time = candles[j].timestamp;
    trade.exit_price = exit_fill;
    trade.exit_reason = reason;
    trade.hold_candles = static_cast<int>(j - entry_index) + 1;
    trade.pnl_pct = (quote - entry_fill) / entry_fill * 100.0;
    trade.pnl_net = (exit_fill - entry_fill) / entry_fill * 100.0 - 2.0 * policy.fee_pct;
    trade.log_return = std::log(exit_fill / entry_fill);
    trade.high_water_mark_pct = hwm;
    trade.low_water_mark_pct = lwm;
    trade.max_drawdown_pct = max_dd;
    return j;
}

} // namespace backtest
} // namespace exitforge
