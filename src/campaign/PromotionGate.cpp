#include "campaign/PromotionGate.h"

#include <iomanip>
#include <sstream>

namespace exitforge {
namespace campaign {

std::string GateDecision::summary() const {
    if (passed) return "passed";
    std::ostringstream oss;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << reasons[i];
    }
    return oss.str();
}

PromotionGate::PromotionGate(const GateThresholds& thresholds)
    : thresholds_(thresholds) {
}

double PromotionGate::maxDrawdownFor(strategy::AssetFamily family) const {
    return strategy::isVolatileFamily(family)
        ? thresholds_.max_drawdown_volatile_pct
        : thresholds_.max_drawdown_default_pct;
}

double PromotionGate::minWinRateFor(strategy::AssetFamily family) const {
    return strategy::isVolatileFamily(family)
        ? thresholds_.min_win_rate_volatile
        : thresholds_.min_win_rate_default;
}

GateDecision PromotionGate::evaluate(const RunMetrics& m, strategy::AssetFamily family) const {
    GateDecision decision;
    const std::string family_name = strategy::toString(family);

    auto fail = [&](const std::string& reason) {
        decision.reasons.push_back(reason);
    };
    auto fmt = [](double v, int precision) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << v;
        return oss.str();
    };

    if (m.trades < thresholds_.min_trades) {
        fail("trades " + std::to_string(m.trades) + " below minimum " +
             std::to_string(thresholds_.min_trades));
    }
    if (!(m.expectancy > thresholds_.min_expectancy_pct)) {
        fail("expectancy " + fmt(m.expectancy, 3) + "% not above " +
             fmt(thresholds_.min_expectancy_pct, 3) + "%");
    }
    if (m.profit_factor < thresholds_.min_profit_factor) {
        fail("profit factor " + fmt(m.profit_factor, 3) + " below " +
             fmt(thresholds_.min_profit_factor, 3));
    }

    const double dd_ceiling = maxDrawdownFor(family);
    if (m.max_drawdown_pct > dd_ceiling) {
        fail("max drawdown " + fmt(m.max_drawdown_pct, 2) + "% exceeds " +
             fmt(dd_ceiling, 2) + "% ceiling for " + family_name);
    }

    const double wr_floor = minWinRateFor(family);
    if (m.win_rate < wr_floor) {
        fail("win rate " + fmt(m.win_rate, 3) + " below " + fmt(wr_floor, 3) +
             " floor for " + family_name);
    }

    decision.passed = decision.reasons.empty();
    return decision;
}

} // namespace campaign
} // namespace exitforge
