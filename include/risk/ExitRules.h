#pragma once

#include "strategy/ExitPolicy.h"
#include <string>

namespace exitforge {
namespace risk {

enum class ExitReason {
    NONE,
    TAKE_PROFIT,
    TRAILING_STOP,
    EXPIRED,
    STOP_LOSS
};

// Trade ledger names: tp / trail / expired / sl
std::string toString(ExitReason reason);
ExitReason exitReasonFromString(const std::string& name);

// Live trigger names: tp_hit / trail_stop / expired / sl_hit
std::string triggerKindName(ExitReason reason);

// Returns observed over one evaluation step, in percent of entry.
// Simulation feeds the candle high/low, the live loop feeds the same tick price twice.
struct ExitObservation {
    double best_pnl_pct = 0.0;
    double worst_pnl_pct = 0.0;
    double high_water_mark_pct = 0.0;   // already includes best_pnl_pct
    bool hold_expired = false;
};

// Priority: take-profit > trailing stop > max-hold expiry > stop-loss.
// OHLC carries no intra-candle ordering, so a candle touching both TP and SL
// is credited as TP.
ExitReason evaluateExit(const strategy::ExitPolicy& policy, const ExitObservation& observed);

// Price the exit is quoted at before slippage
double exitQuotePrice(const strategy::ExitPolicy& policy,
                      ExitReason reason,
                      double entry_price,
                      double high_water_mark_pct,
                      double fallback_price);

} // namespace risk
} // namespace exitforge
