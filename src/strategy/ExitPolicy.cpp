#include "strategy/ExitPolicy.h"
#include "common/Errors.h"

#include <sstream>
#include <iomanip>

namespace exitforge {
namespace strategy {

std::string ExitPolicy::validationError() const {
    if (stop_loss_pct < 0.0) return "stop_loss_pct must be >= 0";
    if (take_profit_pct < 0.0) return "take_profit_pct must be >= 0";
    if (trailing_stop_pct < 0.0) return "trailing_stop_pct must be >= 0";
    if (max_hold_candles < 0) return "max_hold_candles must be >= 0";
    if (slippage_pct < 0.0) return "slippage_pct must be >= 0";
    if (fee_pct < 0.0) return "fee_pct must be >= 0";
    if (stop_loss_pct == 0.0 && take_profit_pct == 0.0) {
        return "stop_loss_pct and take_profit_pct are both zero";
    }
    return "";
}

void ExitPolicy::validate() const {
    const std::string err = validationError();
    if (!err.empty()) {
        throw InvalidConfigurationError("exit policy " + describe() + ": " + err);
    }
}

std::string ExitPolicy::describe() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "SL" << stop_loss_pct << "/TP" << take_profit_pct
        << "/TR" << trailing_stop_pct << "/H" << max_hold_candles;
    return oss.str();
}

nlohmann::json toJson(const ExitPolicy& policy) {
    nlohmann::json j;
    j["stop_loss_pct"] = policy.stop_loss_pct;
    j["take_profit_pct"] = policy.take_profit_pct;
    j["trailing_stop_pct"] = policy.trailing_stop_pct;
    j["max_hold_candles"] = policy.max_hold_candles;
    j["slippage_pct"] = policy.slippage_pct;
    j["fee_pct"] = policy.fee_pct;
    return j;
}

ExitPolicy exitPolicyFromJson(const nlohmann::json& j) {
    ExitPolicy policy;
    policy.stop_loss_pct = j.value("stop_loss_pct", 0.0);
    policy.take_profit_pct = j.value("take_profit_pct", 0.0);
    policy.trailing_stop_pct = j.value("trailing_stop_pct", 0.0);
    policy.max_hold_candles = j.value("max_hold_candles", 0);
    policy.slippage_pct = j.value("slippage_pct", 0.0);
    policy.fee_pct = j.value("fee_pct", 0.0);
    return policy;
}

} // namespace strategy
} // namespace exitforge
