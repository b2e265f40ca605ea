#include "risk/ExitRules.h"
#include "common/Errors.h"

namespace exitforge {
namespace risk {

std::string toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::TAKE_PROFIT: return "tp";
        case ExitReason::TRAILING_STOP: return "trail";
        case ExitReason::EXPIRED: return "expired";
        case ExitReason::STOP_LOSS: return "sl";
        case ExitReason::NONE: break;
    }
    return "none";
}

ExitReason exitReasonFromString(const std::string& name) {
    if (name == "tp" || name == "tp_hit") return ExitReason::TAKE_PROFIT;
    if (name == "trail" || name == "trail_stop") return ExitReason::TRAILING_STOP;
    if (name == "expired") return ExitReason::EXPIRED;
    if (name == "sl" || name == "sl_hit") return ExitReason::STOP_LOSS;
    if (name == "none" || name.empty()) return ExitReason::NONE;
    throw InvalidConfigurationError("unknown exit reason '" + name + "'");
}

std::string triggerKindName(ExitReason reason) {
    switch (reason) {
        case ExitReason::TAKE_PROFIT: return "tp_hit";
        case ExitReason::TRAILING_STOP: return "trail_stop";
        case ExitReason::EXPIRED: return "expired";
        case ExitReason::STOP_LOSS: return "sl_hit";
        case ExitReason::NONE: break;
    }
    return "none";
}

ExitReason evaluateExit(const strategy::ExitPolicy& policy, const ExitObservation& observed) {
    if (policy.take_profit_pct > 0.0 && observed.best_pnl_pct >= policy.take_profit_pct) {
        return ExitReason::TAKE_PROFIT;
    }

    // Armed only once the peak has cleared the trail distance
    const double trail = policy.trailing_stop_pct;
    if (trail > 0.0 && observed.high_water_mark_pct > trail &&
        observed.high_water_mark_pct - observed.worst_pnl_pct >= trail) {
        return ExitReason::TRAILING_STOP;
    }

    if (observed.hold_expired) {
        return ExitReason::EXPIRED;
    }

    if (policy.stop_loss_pct > 0.0 && observed.worst_pnl_pct <= -policy.stop_loss_pct) {
        return ExitReason::STOP_LOSS;
    }

    return ExitReason::NONE;
}

double exitQuotePrice(const strategy::ExitPolicy& policy,
                      ExitReason reason,
                      double entry_price,
                      double high_water_mark_pct,
                      double fallback_price) {
    switch (reason) {
        case ExitReason::TAKE_PROFIT:
            return entry_price * (1.0 + policy.take_profit_pct / 100.0);
        case ExitReason::TRAILING_STOP:
            return entry_price * (1.0 + (high_water_mark_pct - policy.trailing_stop_pct) / 100.0);
        case ExitReason::STOP_LOSS:
            return entry_price * (1.0 - policy.stop_loss_pct / 100.0);
        case ExitReason::EXPIRED:
        case ExitReason::NONE:
            break;
    }
    return fallback_price;
}

} // namespace risk
} // namespace exitforge
