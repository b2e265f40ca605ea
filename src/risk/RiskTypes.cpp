#include "risk/RiskTypes.h"
#include "common/Errors.h"

namespace exitforge {
namespace risk {

LivePosition livePositionFromJson(const nlohmann::json& j) {
    LivePosition p;
    p.id = j.value("id", std::string());
    p.instrument = j.value("instrument", std::string());
    p.entry_price = j.value("entry_price", 0.0);
    p.exits.stop_loss_pct = j.value("stop_loss_pct", 0.0);
    p.exits.take_profit_pct = j.value("take_profit_pct", 0.0);
    p.exits.trailing_stop_pct = j.value("trailing_stop_pct", 0.0);
    p.entry_time_ms = j.value("entry_time_ms", 0LL);
    p.max_age_ms = j.value("max_age_ms", 0LL);
    p.high_water_mark_pct = j.value("high_water_mark_pct", 0.0);

    if (p.id.empty() || p.instrument.empty()) {
        throw InvalidConfigurationError("position needs id and instrument");
    }
    if (p.entry_price <= 0.0) {
        throw InvalidConfigurationError("position " + p.id + " has non-positive entry price");
    }
    if (p.exits.stop_loss_pct < 0.0 || p.exits.take_profit_pct < 0.0 ||
        p.exits.trailing_stop_pct < 0.0 || p.max_age_ms < 0) {
        throw InvalidConfigurationError("position " + p.id + " has negative exit thresholds");
    }
    return p;
}

} // namespace risk
} // namespace exitforge
