#include "risk/RiskEvaluator.h"

#include <algorithm>
#include <set>

namespace exitforge {
namespace risk {

RiskEvaluator::RiskEvaluator(long long debounce_ms)
    : debouncer_(debounce_ms) {
}

void RiskEvaluator::sync(const std::vector<LivePosition>& positions) {
    std::map<std::string, LivePosition> next;
    std::set<std::string> ids;

    for (const auto& p : positions) {
        LivePosition copy = p;
        auto it = positions_.find(p.id);
        if (it != positions_.end()) {
            copy.high_water_mark_pct = std::max(copy.high_water_mark_pct, it->second.high_water_mark_pct);
        }
        ids.insert(p.id);
        next[p.id] = copy;
    }

    positions_.swap(next);
    debouncer_.retain(ids);
}

void RiskEvaluator::clear() {
    positions_.clear();
    debouncer_.clear();
}

std::vector<std::string> RiskEvaluator::instruments() const {
    std::set<std::string> unique;
    for (const auto& [id, p] : positions_) {
        unique.insert(p.instrument);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

std::optional<LivePosition> RiskEvaluator::position(const std::string& id) const {
    auto it = positions_.find(id);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

EvaluationResult RiskEvaluator::evaluate(const std::map<std::string, double>& prices, long long now_ms) {
    EvaluationResult result;

    for (auto& [id, p] : positions_) {
        auto price_it = prices.find(p.instrument);
        if (price_it == prices.end() || p.entry_price <= 0.0) {
            continue;
        }

        const double price = price_it->second;
        const double pnl = (price - p.entry_price) / p.entry_price * 100.0;
        p.high_water_mark_pct = std::max(p.high_water_mark_pct, pnl);

        PriceUpdate update;
        update.id = id;
        update.price = price;
        update.pnl_pct = pnl;
        update.high_water_mark_pct = p.high_water_mark_pct;
        result.updates.push_back(update);

        if (!p.hasAnyExit()) {
            continue;
        }

        ExitObservation observed;
        observed.best_pnl_pct = pnl;
        observed.worst_pnl_pct = pnl;
        observed.high_water_mark_pct = p.high_water_mark_pct;
        observed.hold_expired = p.max_age_ms > 0 && now_ms - p.entry_time_ms >= p.max_age_ms;

        const ExitReason kind = evaluateExit(p.exits, observed);
        if (kind == ExitReason::NONE || !debouncer_.allow(id, kind, now_ms)) {
            continue;
        }

        TriggerEvent event;
        event.position_id = id;
        event.instrument = p.instrument;
        event.kind = kind;
        event.pnl_pct = pnl;
        event.price = price;
        event.high_water_mark_pct = p.high_water_mark_pct;
        event.ts_ms = now_ms;
        result.triggers.push_back(event);
    }

    return result;
}

} // namespace risk
} // namespace exitforge
